////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#pragma once

#include <ostream>
#include <sstream>
#include <string>

namespace lockstep
{

/** @brief An object that can name itself in messages and logs. */
class Describable
{
public:
    virtual ~Describable() = default;

    /** @brief Write a one-line description, e.g. "Vector<int>[3]". */
    virtual void short_describe(std::ostream& os) const = 0;

    std::string short_description() const
    {
        std::ostringstream os;
        short_describe(os);
        return os.str();
    }
};

inline std::ostream& operator<<(std::ostream& os, Describable const& obj)
{
    obj.short_describe(os);
    return os;
}

} // namespace lockstep

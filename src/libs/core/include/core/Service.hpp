/*
 * Copyright (C) 2025 The Trippy contributors
 *
 * This file is part of Trippy.
 *
 * Trippy is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Trippy is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Trippy.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <memory>

#include "core/Exception.hpp"

namespace trippy::core
{
    // Process wide instance of Interface (configuration, logger), registered
    // for the lifetime of the Service object
    template<typename Interface>
    class Service
    {
    public:
        explicit Service(std::unique_ptr<Interface> instance)
        {
            if (!instance)
                throw TrippyException{ "Cannot register an empty service" };
            if (_instance)
                throw TrippyException{ "Service already registered" };

            _instance = std::move(instance);
        }

        ~Service() { _instance.reset(); }

        Service(const Service&) = delete;
        Service& operator=(const Service&) = delete;

        Interface* operator->() const { return _instance.get(); }
        Interface& operator*() const { return *_instance; }

        // nullptr if nothing is registered
        static Interface* get() { return _instance.get(); }

    private:
        static inline std::unique_ptr<Interface> _instance;
    };
} // namespace trippy::core

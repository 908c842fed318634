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

#include "Config.hpp"

#include "core/Exception.hpp"
#include "core/ILogger.hpp"

namespace trippy::core
{
    std::unique_ptr<IConfig> createConfig(const std::filesystem::path& p)
    {
        return std::make_unique<Config>(p);
    }

    Config::Config(const std::filesystem::path& p)
    {
        try
        {
            _config.readFile(p.c_str());
        }
        catch (const libconfig::FileIOException&)
        {
            throw TrippyException{ "Cannot open config file '" + p.string() + "'" };
        }
        catch (const libconfig::ParseException& e)
        {
            throw TrippyException{ "Cannot parse config file '" + p.string() + "', line = " + std::to_string(e.getLine()) + ", error = '" + e.getError() + "'" };
        }
    }

    const libconfig::Setting* Config::lookup(std::string_view setting) const
    {
        const std::string path{ setting };
        if (!_config.exists(path))
            return nullptr;

        return &_config.lookup(path);
    }

    std::string_view Config::getString(std::string_view setting, std::string_view def)
    {
        const libconfig::Setting* value{ lookup(setting) };
        if (!value || value->getType() != libconfig::Setting::TypeString)
            return def;

        return value->c_str();
    }

    std::filesystem::path Config::getPath(std::string_view setting, const std::filesystem::path& def)
    {
        const libconfig::Setting* value{ lookup(setting) };
        if (!value || value->getType() != libconfig::Setting::TypeString)
            return def;

        return std::filesystem::path{ std::string{ value->c_str() } };
    }

    unsigned long Config::getULong(std::string_view setting, unsigned long def)
    {
        const long value{ getLong(setting, static_cast<long>(def)) };
        if (value < 0)
        {
            TRIPPY_LOG(CONFIG, WARNING, "Negative value for setting '" << setting << "', using default value " << def);
            return def;
        }

        return static_cast<unsigned long>(value);
    }

    long Config::getLong(std::string_view setting, long def)
    {
        const libconfig::Setting* value{ lookup(setting) };
        if (!value)
            return def;

        switch (value->getType())
        {
        case libconfig::Setting::TypeInt:
            return static_cast<int>(*value);
        case libconfig::Setting::TypeInt64:
            return static_cast<long>(static_cast<long long>(*value));
        default:
            TRIPPY_LOG(CONFIG, WARNING, "Setting '" << setting << "' is not an integer, using default value " << def);
            return def;
        }
    }

    bool Config::getBool(std::string_view setting, bool def)
    {
        const libconfig::Setting* value{ lookup(setting) };
        if (!value || value->getType() != libconfig::Setting::TypeBoolean)
            return def;

        return static_cast<bool>(*value);
    }
} // namespace trippy::core

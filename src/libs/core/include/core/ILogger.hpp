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

#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include "core/Service.hpp"

namespace trippy::core::logging
{
    enum class Severity
    {
        FATAL,
        ERROR,
        WARNING,
        INFO,
        DEBUG,
    };

    enum class Module
    {
        CATALOG,
        CONFIG,
        MAIN,
        RECOMMENDATION,
        SEMANTIC,
        SERVICE,
        UTILS,
    };

    const char* getModuleName(Module mod);
    const char* getSeverityName(Severity sev);

    class ILogger;
    class Log
    {
    public:
        Log(ILogger& logger, Module module, Severity severity);
        ~Log();

        Module getModule() const { return _module; }
        Severity getSeverity() const { return _severity; }
        std::string getMessage() const;

        std::ostringstream& getOstream() { return _oss; }

    private:
        Log(const Log&) = delete;
        Log& operator=(const Log&) = delete;

        ILogger& _logger;
        Module _module;
        Severity _severity;
        std::ostringstream _oss;
    };

    class ILogger
    {
    public:
        virtual ~ILogger() = default;

        virtual bool isSeverityActive(Severity severity) const = 0;
        virtual void processLog(const Log& log) = 0;
        virtual void processLog(Module module, Severity severity, std::string_view message) = 0;
    };

    static constexpr Severity defaultMinSeverity{ Severity::INFO };
    std::unique_ptr<ILogger> createLogger(Severity minSeverity = defaultMinSeverity, const std::filesystem::path& logFilePath = {});
} // namespace trippy::core::logging

#define TRIPPY_LOG(module, severity, message)                                                                                                                                  \
    do                                                                                                                                                                         \
    {                                                                                                                                                                          \
        if (auto* logger_{ ::trippy::core::Service<::trippy::core::logging::ILogger>::get() }; logger_ && logger_->isSeverityActive(::trippy::core::logging::Severity::severity)) \
            ::trippy::core::logging::Log{ *logger_, ::trippy::core::logging::Module::module, ::trippy::core::logging::Severity::severity }.getOstream() << message;               \
    } while (0)

#define TRIPPY_LOG_IF(module, severity, cond, message)                                                                                                                                 \
    do                                                                                                                                                                                 \
    {                                                                                                                                                                                  \
        if (auto* logger_{ ::trippy::core::Service<::trippy::core::logging::ILogger>::get() }; logger_ && logger_->isSeverityActive(::trippy::core::logging::Severity::severity) && cond) \
            ::trippy::core::logging::Log{ *logger_, ::trippy::core::logging::Module::module, ::trippy::core::logging::Severity::severity }.getOstream() << message;                       \
    } while (0)

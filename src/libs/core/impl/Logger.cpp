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

#include "Logger.hpp"

#include <Wt/WDateTime.h>

#include <cerrno>
#include <iostream>
#include <system_error>
#include <thread>

#include "core/Exception.hpp"
#include "core/String.hpp"

namespace trippy::core::logging
{
    namespace
    {
        std::ostream& getConsoleStream(Severity severity)
        {
            switch (severity)
            {
            case Severity::DEBUG:
            case Severity::INFO:
                return std::cout;
            case Severity::WARNING:
            case Severity::ERROR:
            case Severity::FATAL:
                break;
            }

            return std::cerr;
        }
    } // namespace

    const char* getModuleName(Module mod)
    {
        switch (mod)
        {
        case Module::CATALOG:
            return "CATALOG";
        case Module::CONFIG:
            return "CONFIG";
        case Module::MAIN:
            return "MAIN";
        case Module::RECOMMENDATION:
            return "RECOMMENDATION";
        case Module::SEMANTIC:
            return "SEMANTIC";
        case Module::SERVICE:
            return "SERVICE";
        case Module::UTILS:
            return "UTILS";
        }
        return "";
    }

    const char* getSeverityName(Severity sev)
    {
        switch (sev)
        {
        case Severity::FATAL:
            return "fatal";
        case Severity::ERROR:
            return "error";
        case Severity::WARNING:
            return "warning";
        case Severity::INFO:
            return "info";
        case Severity::DEBUG:
            return "debug";
        }
        return "";
    }

    Log::Log(ILogger& logger, Module module, Severity severity)
        : _logger{ logger }
        , _module{ module }
        , _severity{ severity }
    {
    }

    Log::~Log()
    {
        _logger.processLog(*this);
    }

    std::string Log::getMessage() const
    {
        return _oss.str();
    }

    std::unique_ptr<ILogger> createLogger(Severity minSeverity, const std::filesystem::path& logFilePath)
    {
        return std::make_unique<Logger>(minSeverity, logFilePath);
    }

    Logger::Logger(Severity minSeverity, const std::filesystem::path& logFilePath)
        : _minSeverity{ minSeverity }
    {
        if (logFilePath.empty())
            return;

        _logFile.open(logFilePath, std::ios::out | std::ios::app);
        if (!_logFile.is_open())
        {
            const std::error_code ec{ errno, std::generic_category() };
            throw TrippyException{ "Cannot open log file '" + logFilePath.string() + "' for writing: " + ec.message() };
        }
    }

    // Severities are declared from the most to the least severe
    bool Logger::isSeverityActive(Severity severity) const
    {
        return static_cast<int>(severity) <= static_cast<int>(_minSeverity);
    }

    void Logger::processLog(const Log& log)
    {
        processLog(log.getModule(), log.getSeverity(), log.getMessage());
    }

    void Logger::processLog(Module module, Severity severity, std::string_view message)
    {
        if (!isSeverityActive(severity))
            return;

        const Wt::WDateTime now{ Wt::WDateTime::currentDateTime() };

        const std::scoped_lock lock{ _mutex };
        getOutputStream(severity) << stringUtils::toISO8601String(now) << " " << std::this_thread::get_id() << " [" << getSeverityName(severity) << "] [" << getModuleName(module) << "] " << message << std::endl;
    }

    std::ostream& Logger::getOutputStream(Severity severity)
    {
        if (_logFile.is_open())
            return _logFile;

        return getConsoleStream(severity);
    }
} // namespace trippy::core::logging

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

#include <filesystem>
#include <fstream>
#include <sstream>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"

namespace trippy::core::tests
{
    namespace
    {
        class ScopedLogFile
        {
        public:
            ScopedLogFile()
                : _path{ std::filesystem::temp_directory_path() / ("trippy-test-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "-" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".log") }
            {
                std::filesystem::remove(_path);
            }

            ~ScopedLogFile()
            {
                std::error_code ec;
                std::filesystem::remove(_path, ec);
            }

            const std::filesystem::path& getPath() const { return _path; }

            std::string getContent() const
            {
                std::ifstream ifs{ _path };
                std::ostringstream oss;
                oss << ifs.rdbuf();

                return oss.str();
            }

        private:
            std::filesystem::path _path;
        };
    } // namespace

    TEST(Service, registration)
    {
        EXPECT_EQ(Service<logging::ILogger>::get(), nullptr);

        {
            Service<logging::ILogger> logger{ logging::createLogger() };
            EXPECT_NE(Service<logging::ILogger>::get(), nullptr);
            EXPECT_EQ(Service<logging::ILogger>::get(), &(*logger));

            // other interfaces are not affected
            EXPECT_EQ(Service<IConfig>::get(), nullptr);
        }

        EXPECT_EQ(Service<logging::ILogger>::get(), nullptr);
    }

    TEST(Service, singleRegistration)
    {
        Service<logging::ILogger> logger{ logging::createLogger() };
        logging::ILogger* const registeredLogger{ Service<logging::ILogger>::get() };

        EXPECT_THROW(Service<logging::ILogger>{ logging::createLogger() }, TrippyException);
        EXPECT_EQ(Service<logging::ILogger>::get(), registeredLogger);
    }

    TEST(Service, emptyRegistration)
    {
        EXPECT_THROW(Service<IConfig>{ nullptr }, TrippyException);
        EXPECT_EQ(Service<IConfig>::get(), nullptr);
    }

    TEST(Logger, minSeverity)
    {
        const auto logger{ logging::createLogger(logging::Severity::WARNING) };

        EXPECT_TRUE(logger->isSeverityActive(logging::Severity::FATAL));
        EXPECT_TRUE(logger->isSeverityActive(logging::Severity::ERROR));
        EXPECT_TRUE(logger->isSeverityActive(logging::Severity::WARNING));
        EXPECT_FALSE(logger->isSeverityActive(logging::Severity::INFO));
        EXPECT_FALSE(logger->isSeverityActive(logging::Severity::DEBUG));

        EXPECT_TRUE(logging::createLogger(logging::Severity::DEBUG)->isSeverityActive(logging::Severity::DEBUG));
        EXPECT_FALSE(logging::createLogger(logging::Severity::FATAL)->isSeverityActive(logging::Severity::ERROR));
    }

    TEST(Logger, logFile)
    {
        const ScopedLogFile file;

        {
            Service<logging::ILogger> logger{ logging::createLogger(logging::Severity::INFO, file.getPath()) };

            TRIPPY_LOG(CATALOG, INFO, "Loaded " << 3 << " users");
            TRIPPY_LOG(SEMANTIC, DEBUG, "Query text = 'art'");
            TRIPPY_LOG_IF(RECOMMENDATION, WARNING, false, "Semantic score out of range");
            TRIPPY_LOG_IF(RECOMMENDATION, ERROR, true, "Cannot load catalog");
        }

        const std::string content{ file.getContent() };
        EXPECT_NE(content.find("[info] [CATALOG] Loaded 3 users\n"), std::string::npos);
        EXPECT_NE(content.find("[error] [RECOMMENDATION] Cannot load catalog\n"), std::string::npos);
        EXPECT_EQ(content.find("Query text"), std::string::npos);
        EXPECT_EQ(content.find("out of range"), std::string::npos);
    }

    TEST(Logger, logFileAppends)
    {
        const ScopedLogFile file;

        for (std::string_view message : { "first", "second" })
        {
            Service<logging::ILogger> logger{ logging::createLogger(logging::Severity::INFO, file.getPath()) };
            TRIPPY_LOG(MAIN, INFO, message);
        }

        const std::string content{ file.getContent() };
        const std::size_t firstPos{ content.find("[MAIN] first") };
        ASSERT_NE(firstPos, std::string::npos);
        EXPECT_NE(content.find("[MAIN] second", firstPos), std::string::npos);
    }

    TEST(Logger, invalidLogFile)
    {
        EXPECT_THROW(logging::createLogger(logging::Severity::INFO, std::filesystem::temp_directory_path() / "trippy-no-such-dir" / "sub" / "trippy.log"), TrippyException);
    }

    TEST(Logger, noRegisteredLogger)
    {
        ASSERT_EQ(Service<logging::ILogger>::get(), nullptr);

        bool evaluated{};
        auto evaluate{ [&] {
            evaluated = true;
            return "message";
        } };

        TRIPPY_LOG(MAIN, FATAL, evaluate());
        EXPECT_FALSE(evaluated);
    }
} // namespace trippy::core::tests

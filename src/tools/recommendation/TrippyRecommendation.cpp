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

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <set>

#include <boost/program_options.hpp>
#include <Wt/WDateTime.h>

#include "catalog/ICatalog.hpp"
#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "core/String.hpp"
#include "services/recommendation/IRecommendationService.hpp"
#include "services/semantic/ISemanticService.hpp"

namespace trippy
{
    namespace
    {
        constexpr unsigned minAge{ 1 };
        constexpr unsigned maxAge{ 120 };
        constexpr std::size_t interactiveRecommendationCount{ 50 };

        core::logging::Severity getLogMinSeverity(core::IConfig& config)
        {
            const std::string_view minSeverity{ config.getString("log-min-severity", "info") };

            if (minSeverity == "debug")
                return core::logging::Severity::DEBUG;
            else if (minSeverity == "info")
                return core::logging::Severity::INFO;
            else if (minSeverity == "warning")
                return core::logging::Severity::WARNING;
            else if (minSeverity == "error")
                return core::logging::Severity::ERROR;
            else if (minSeverity == "fatal")
                return core::logging::Severity::FATAL;

            throw core::TrippyException{ "Invalid config value for 'log-min-severity'" };
        }

        std::unique_ptr<semantic::ISemanticService> createSemanticService(core::IConfig& config)
        {
            const std::string semanticEngine{ core::stringUtils::stringToLower(config.getString("semantic-engine", "tfidf")) };

            if (semanticEngine == "tfidf")
                return semantic::createTfIdfSemanticService();
            else if (semanticEngine == "none")
                return nullptr;

            throw core::TrippyException{ "Invalid config value for 'semantic-engine'" };
        }

        catalog::User getOrCreateUser(catalog::ICatalog& catalog, std::string_view userId, std::optional<unsigned> age, std::string_view destination)
        {
            if (std::optional<catalog::User> user{ catalog.findUser(userId) })
                return *user;

            if (!age)
                throw core::TrippyException{ "User '" + std::string{ userId } + "' not found, age must be provided to create it" };

            catalog::User user{ std::string{ userId }, *age, {}, { std::string{ destination } } };
            catalog.saveUser(user);
            TRIPPY_LOG(MAIN, INFO, "Created user '" << userId << "'");

            return user;
        }

        void printSeparator()
        {
            std::cout << std::endl
                      << std::string(60, '=') << std::endl
                      << std::endl;
        }

        void displayRecommendation(const recommendation::Recommendation& recommendation)
        {
            const catalog::Item& item{ recommendation.item };

            std::cout << item.name << " (" << catalog::toString(item.getKind()) << ")" << std::endl;
            std::cout << "   Category: " << item.category << std::endl;
            if (const catalog::Place * place{ item.getPlace() })
                std::cout << "   Location: " << place->location << std::endl;
            if (!item.features.tags.empty())
                std::cout << "   Tags: " << core::stringUtils::joinStrings(item.features.tags, ", ") << std::endl;
            if (!item.features.energyLevel.empty())
                std::cout << "   Energy Level: " << item.features.energyLevel << std::endl;
            if (item.features.priceRange)
                std::cout << "   Price Range: " << *item.features.priceRange << std::endl;
            if (item.description)
                std::cout << "   Description: " << *item.description << std::endl;
            std::cout << "   Recommendation Score: " << std::fixed << std::setprecision(2) << recommendation.score << std::endl;
        }

        void dumpRecommendations(const recommendation::IRecommendationService& recommendationService, const catalog::User& user, std::string_view destination, std::size_t maxCount)
        {
            const recommendation::RecommendationContainer recommendations{ recommendationService.getRecommendations(user, destination, maxCount) };

            std::cout << "*** Recommendations for user '" << user.id << "' in '" << destination << "' (" << recommendations.size() << ") ***" << std::endl;
            for (const recommendation::Recommendation& recommendation : recommendations)
            {
                printSeparator();
                displayRecommendation(recommendation);
            }
        }

        enum class Choice
        {
            Like,
            Dislike,
            Skip,
            Quit,
        };

        Choice readChoice()
        {
            std::string line;
            while (true)
            {
                std::cout << "Your choice (like/dislike/skip/quit): " << std::flush;
                if (!std::getline(std::cin, line))
                    return Choice::Quit;

                const std::string choice{ core::stringUtils::stringToLower(core::stringUtils::stringTrim(line)) };
                if (choice == "like" || choice == "l")
                    return Choice::Like;
                if (choice == "dislike" || choice == "d")
                    return Choice::Dislike;
                if (choice == "skip" || choice == "s")
                    return Choice::Skip;
                if (choice == "quit" || choice == "q")
                    return Choice::Quit;

                std::cout << "Invalid input. Please enter: like/l, dislike/d, skip/s, or quit/q" << std::endl;
            }
        }

        // Ratings are written through the catalog, next recommendations take them into account
        void runInteractiveSession(catalog::ICatalog& catalog, const recommendation::IRecommendationService& recommendationService, const catalog::User& user, std::string_view destination)
        {
            std::set<catalog::ItemKey> shownItems;
            std::size_t likeCount{};
            std::size_t dislikeCount{};
            std::size_t skipCount{};

            std::cout << "Swipe through recommendations for " << destination << " (like/dislike/skip/quit)" << std::endl;

            while (true)
            {
                const recommendation::RecommendationContainer recommendations{ recommendationService.getRecommendations(user, destination, interactiveRecommendationCount) };
                const auto itRecommendation{ std::find_if(std::cbegin(recommendations), std::cend(recommendations), [&](const recommendation::Recommendation& recommendation) {
                    return !shownItems.contains(recommendation.item.getKey());
                }) };

                if (itRecommendation == std::cend(recommendations))
                {
                    std::cout << "You've seen all available recommendations!" << std::endl;
                    break;
                }

                const catalog::Item& item{ itRecommendation->item };
                shownItems.insert(item.getKey());

                printSeparator();
                displayRecommendation(*itRecommendation);
                printSeparator();

                const Choice choice{ readChoice() };
                if (choice == Choice::Quit)
                    break;

                if (choice == Choice::Skip)
                {
                    skipCount++;
                    continue;
                }

                const catalog::Rating rating{ choice == Choice::Like ? catalog::Rating::Like : catalog::Rating::Dislike };
                catalog.addInteraction(catalog::Interaction{ user.id, item.id, item.getKind(), rating, Wt::WDateTime::currentDateTime() });
                if (rating == catalog::Rating::Like)
                    likeCount++;
                else
                    dislikeCount++;
            }

            std::cout << "Session summary:" << std::endl;
            std::cout << "  Liked: " << likeCount << std::endl;
            std::cout << "  Disliked: " << dislikeCount << std::endl;
            std::cout << "  Skipped: " << skipCount << std::endl;
        }
    } // namespace
} // namespace trippy

int main(int argc, char* argv[])
{
    try
    {
        using namespace trippy;
        namespace po = boost::program_options;

        po::options_description desc{ "Allowed options" };
        desc.add_options()("help,h", "print usage message")("conf,c", po::value<std::string>()->default_value("/etc/trippy.conf"), "Trippy config file")("destination,d", po::value<std::string>()->required(), "Destination")("user,u", po::value<std::string>(), "User id, defaults to user_<destination>_<age>")("age,a", po::value<unsigned>(), "User age, required to create the user")("max,m", po::value<unsigned>()->default_value(10), "Max recommendation count")("interactive,i", "Like or dislike recommendations one at a time");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help"))
        {
            std::cout << desc << std::endl;
            return EXIT_SUCCESS;
        }
        po::notify(vm);

        core::Service<core::IConfig> config{ core::createConfig(vm["conf"].as<std::string>()) };
        core::Service<core::logging::ILogger> logger{ core::logging::createLogger(getLogMinSeverity(*config), config->getPath("log-file", "")) };

        const std::string destination{ core::stringUtils::stringTrim(vm["destination"].as<std::string>()) };
        if (destination.empty())
            throw core::TrippyException{ "Destination is required" };

        std::optional<unsigned> age;
        if (vm.count("age"))
        {
            age = vm["age"].as<unsigned>();
            if (*age < minAge || *age > maxAge)
                throw core::TrippyException{ "Age must be in [" + std::to_string(minAge) + ", " + std::to_string(maxAge) + "]" };
        }

        std::string userId;
        if (vm.count("user"))
            userId = vm["user"].as<std::string>();
        else if (age)
            userId = "user_" + destination + "_" + std::to_string(*age);
        else
            throw core::TrippyException{ "Either user or age must be provided" };

        const auto catalog{ catalog::createJsonCatalog(config->getPath("catalog-file", "/var/trippy/catalog.json")) };
        const auto semanticService{ createSemanticService(*config) };

        recommendation::Settings settings;
        settings.neighborCount = config->getULong("recommendation-neighbor-count", settings.neighborCount);
        const auto recommendationService{ recommendation::createRecommendationService(*catalog, semanticService.get(), settings) };

        const catalog::User user{ getOrCreateUser(*catalog, userId, age, destination) };

        if (vm.count("interactive"))
            runInteractiveSession(*catalog, *recommendationService, user, destination);
        else
            dumpRecommendations(*recommendationService, user, destination, vm["max"].as<unsigned>());
    }
    catch (std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

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

#include "JsonSerializer.hpp"

#include <Wt/Json/Array.h>
#include <Wt/Json/Object.h>
#include <Wt/Json/Parser.h>
#include <Wt/Json/Serializer.h>
#include <Wt/Json/Value.h>
#include <Wt/WException.h>
#include <Wt/WString.h>

#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace trippy::catalog::json
{
    namespace
    {
        // Keys of the item features object
        constexpr const char* energyLevelKey{ "energy_level" };
        constexpr const char* tagsKey{ "tags" };
        constexpr const char* ageSuitabilityProfileKey{ "age_suitability_profile" };
        constexpr const char* priceRangeKey{ "price_range" };

        std::string getMandatoryString(const Wt::Json::Object& obj, const std::string& key)
        {
            const Wt::Json::Value& value{ obj.get(key) };
            if (value.type() != Wt::Json::Type::String)
                throw Exception{ "missing or invalid '" + key + "'" };

            return static_cast<std::string>(value);
        }

        std::optional<std::string> getOptionalString(const Wt::Json::Object& obj, const std::string& key)
        {
            const Wt::Json::Value& value{ obj.get(key) };
            if (value.type() != Wt::Json::Type::String)
                return std::nullopt;

            return static_cast<std::string>(value);
        }

        std::vector<std::string> getStrings(const Wt::Json::Value& value)
        {
            std::vector<std::string> res;

            if (value.type() != Wt::Json::Type::Array)
                return res;

            for (const Wt::Json::Value& entry : static_cast<const Wt::Json::Array&>(value))
            {
                if (entry.type() == Wt::Json::Type::String)
                    res.push_back(static_cast<std::string>(entry));
            }

            return res;
        }

        Wt::Json::Value toJsonValue(std::string_view str)
        {
            return Wt::Json::Value{ Wt::WString::fromUTF8(std::string{ str }) };
        }

        Wt::Json::Value toJsonValue(const std::vector<std::string>& strings)
        {
            Wt::Json::Array array;
            for (const std::string& str : strings)
                array.push_back(toJsonValue(str));

            return Wt::Json::Value{ std::move(array) };
        }

        ItemFeatures parseFeatures(const Wt::Json::Value& value)
        {
            ItemFeatures features;

            if (value.type() != Wt::Json::Type::Object)
                return features;

            for (const auto& [key, featureValue] : static_cast<const Wt::Json::Object&>(value))
            {
                if (key == energyLevelKey && featureValue.type() == Wt::Json::Type::String)
                {
                    features.energyLevel = core::stringUtils::stringToLower(static_cast<std::string>(featureValue));
                    continue;
                }
                else if (key == tagsKey)
                {
                    features.tags = getStrings(featureValue);
                    continue;
                }
                else if (key == ageSuitabilityProfileKey && featureValue.type() == Wt::Json::Type::String)
                {
                    features.ageSuitabilityProfile = static_cast<std::string>(featureValue);
                    continue;
                }
                else if (key == priceRangeKey && featureValue.type() == Wt::Json::Type::String)
                {
                    features.priceRange = static_cast<std::string>(featureValue);
                    continue;
                }

                features.extra.emplace(key, featureValue);
            }

            return features;
        }

        Wt::Json::Object serializeFeatures(const ItemFeatures& features)
        {
            Wt::Json::Object obj = features.extra;

            if (!features.energyLevel.empty())
                obj[energyLevelKey] = toJsonValue(features.energyLevel);
            obj[tagsKey] = toJsonValue(features.tags);
            obj[ageSuitabilityProfileKey] = toJsonValue(features.ageSuitabilityProfile);
            if (features.priceRange)
                obj[priceRangeKey] = toJsonValue(*features.priceRange);

            return obj;
        }

        Item parseItem(const Wt::Json::Object& obj, ItemKind kind)
        {
            Item item;
            item.id = getMandatoryString(obj, "id");
            item.name = getMandatoryString(obj, "name");
            item.category = getOptionalString(obj, "category").value_or("");
            item.description = getOptionalString(obj, "description");
            item.features = parseFeatures(obj.get("features"));

            switch (kind)
            {
            case ItemKind::Place:
                item.details = Place{ getMandatoryString(obj, "location") };
                break;
            case ItemKind::Activity:
                item.details = Activity{ getMandatoryString(obj, "place_id") };
                break;
            }

            return item;
        }

        Wt::Json::Object serializeItem(const Item& item)
        {
            Wt::Json::Object obj;
            obj["id"] = toJsonValue(item.id);
            obj["name"] = toJsonValue(item.name);
            obj["category"] = toJsonValue(item.category);
            obj["description"] = item.description ? toJsonValue(*item.description) : Wt::Json::Value{ Wt::Json::Type::Null };
            obj["features"] = Wt::Json::Value{ serializeFeatures(item.features) };

            if (const Place * place{ item.getPlace() })
                obj["location"] = toJsonValue(place->location);
            else if (const Activity * activity{ item.getActivity() })
                obj["place_id"] = toJsonValue(activity->placeId);

            return obj;
        }

        User parseUser(const Wt::Json::Object& obj)
        {
            User user;
            user.id = getMandatoryString(obj, "id");

            const Wt::Json::Value& age{ obj.get("age") };
            if (age.type() != Wt::Json::Type::Number || static_cast<int>(age) <= 0)
                throw Exception{ "missing or invalid 'age'" };
            user.age = static_cast<unsigned>(static_cast<int>(age));

            user.preferences = getStrings(obj.get("preferences"));
            user.travelHistory = getStrings(obj.get("travel_history"));

            return user;
        }

        Wt::Json::Object serializeUser(const User& user)
        {
            Wt::Json::Object obj;
            obj["id"] = toJsonValue(user.id);
            obj["age"] = Wt::Json::Value{ static_cast<int>(user.age) };
            obj["preferences"] = toJsonValue(user.preferences);
            obj["travel_history"] = toJsonValue(user.travelHistory);

            return obj;
        }

        Interaction parseInteraction(const Wt::Json::Object& obj)
        {
            Interaction interaction;
            interaction.userId = getMandatoryString(obj, "user_id");
            interaction.itemId = getMandatoryString(obj, "item_id");

            const std::optional<ItemKind> itemType{ parseItemKind(getMandatoryString(obj, "item_type")) };
            if (!itemType)
                throw Exception{ "invalid 'item_type'" };
            interaction.itemType = *itemType;

            const Wt::Json::Value& rating{ obj.get("rating") };
            if (rating.type() != Wt::Json::Type::Number)
                throw Exception{ "missing or invalid 'rating'" };

            switch (static_cast<int>(rating))
            {
            case getRatingValue(Rating::Like):
                interaction.rating = Rating::Like;
                break;
            case getRatingValue(Rating::Dislike):
                interaction.rating = Rating::Dislike;
                break;
            default:
                throw Exception{ "invalid 'rating' value" };
            }

            if (const std::optional<std::string> timestamp{ getOptionalString(obj, "timestamp") })
            {
                interaction.timestamp = core::stringUtils::fromISO8601String(*timestamp);
                TRIPPY_LOG_IF(CATALOG, DEBUG, !interaction.timestamp.isValid(), "Cannot parse interaction timestamp '" << *timestamp << "'");
            }

            return interaction;
        }

        Wt::Json::Object serializeInteraction(const Interaction& interaction)
        {
            Wt::Json::Object obj;
            obj["user_id"] = toJsonValue(interaction.userId);
            obj["item_id"] = toJsonValue(interaction.itemId);
            obj["item_type"] = toJsonValue(toString(interaction.itemType));
            obj["rating"] = Wt::Json::Value{ getRatingValue(interaction.rating) };
            obj["timestamp"] = toJsonValue(core::stringUtils::toISO8601String(interaction.timestamp));

            return obj;
        }

        template<typename T, typename ParseFunc>
        std::vector<T> parseEntries(const Wt::Json::Object& root, const std::string& key, ParseFunc parseFunc)
        {
            std::vector<T> res;

            const Wt::Json::Value& entries{ root.get(key) };
            if (entries.type() == Wt::Json::Type::Null)
                return res;
            if (entries.type() != Wt::Json::Type::Array)
                throw Exception{ "'" + key + "' is not an array" };

            for (const Wt::Json::Value& entry : static_cast<const Wt::Json::Array&>(entries))
            {
                try
                {
                    if (entry.type() != Wt::Json::Type::Object)
                        throw Exception{ "not an object" };

                    res.push_back(parseFunc(static_cast<const Wt::Json::Object&>(entry)));
                }
                catch (const Exception& e)
                {
                    TRIPPY_LOG(CATALOG, WARNING, "Cannot parse entry in '" << key << "': " << e.what() << ", skipping");
                }
                catch (const Wt::WException& e)
                {
                    TRIPPY_LOG(CATALOG, WARNING, "Cannot parse entry in '" << key << "': " << e.what() << ", skipping");
                }
            }

            TRIPPY_LOG(CATALOG, DEBUG, "Parsed " << res.size() << " entries in '" << key << "'");

            return res;
        }

        template<typename T, typename SerializeFunc>
        Wt::Json::Value serializeEntries(const std::vector<T>& entries, SerializeFunc serializeFunc)
        {
            Wt::Json::Array array;
            array.reserve(entries.size());

            for (const T& entry : entries)
                array.push_back(Wt::Json::Value{ serializeFunc(entry) });

            return Wt::Json::Value{ std::move(array) };
        }
    } // namespace

    CatalogData parseCatalog(std::string_view document)
    {
        Wt::Json::Object root;
        try
        {
            Wt::Json::parse(std::string{ document }, root);
        }
        catch (const Wt::WException& e)
        {
            throw Exception{ std::string{ "Cannot parse catalog: " } + e.what() };
        }

        CatalogData data;
        data.users = parseEntries<User>(root, "users", parseUser);
        data.places = parseEntries<Item>(root, "places", [](const Wt::Json::Object& obj) { return parseItem(obj, ItemKind::Place); });
        data.activities = parseEntries<Item>(root, "activities", [](const Wt::Json::Object& obj) { return parseItem(obj, ItemKind::Activity); });
        data.interactions = parseEntries<Interaction>(root, "interactions", parseInteraction);

        return data;
    }

    std::string serializeCatalog(const CatalogData& data)
    {
        Wt::Json::Object root;
        root["users"] = serializeEntries(data.users, serializeUser);
        root["places"] = serializeEntries(data.places, serializeItem);
        root["activities"] = serializeEntries(data.activities, serializeItem);
        root["interactions"] = serializeEntries(data.interactions, serializeInteraction);

        return Wt::Json::serialize(root, 2);
    }
} // namespace trippy::catalog::json

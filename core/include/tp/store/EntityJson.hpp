#pragma once
#include "tp/store/Types.hpp"
#include <string>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace tp {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

// Entity <-> JSON. Item objects use the per-type field names
// (departure/arrival, checkin/checkout, date) rather than start/end.
void writeTrip(JsonWriter& w, const Trip& t);
void writeItem(JsonWriter& w, const ItineraryItem& item);

// Readers require "id" (uint) and ignore unknown members. Missing optional
// fields keep their defaults.
bool readTrip(const rapidjson::Value& v, Trip& out);
bool readItem(const rapidjson::Value& v, ItemType type, ItineraryItem& out);

std::string tripToJSON(const Trip& t);
std::string itemToJSON(const ItineraryItem& item);

} // namespace tp

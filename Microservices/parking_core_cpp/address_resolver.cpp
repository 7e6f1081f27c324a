#include "address_resolver.h"
#include "errors.h"
#include <cctype>
#include <fstream>

using json = nlohmann::json;

namespace nprpark {

namespace {

bool isPostcodeArea(const std::string& text) {
    if (text.size() != 4 || text[0] == '0') {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // namespace

PostcodeZoneResolver::PostcodeZoneResolver() {}

std::string PostcodeZoneResolver::normalizePostcode(const std::string& postcode) {
    std::string clean;
    for (char c : postcode) {
        if (c != ' ') {
            clean += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    if (clean.size() != 6 || !isPostcodeArea(clean.substr(0, 4)) ||
        !std::isalpha(static_cast<unsigned char>(clean[4])) ||
        !std::isalpha(static_cast<unsigned char>(clean[5]))) {
        return "";
    }
    return clean;
}

void PostcodeZoneResolver::addMapping(const std::string& postcode_area, const std::string& zone_id) {
    if (!isPostcodeArea(postcode_area) || zone_id.empty()) {
        throw TariffError(ErrorCode::MALFORMED_TARIFF_DATA,
                          "Invalid postcode mapping '" + postcode_area + "' -> '" + zone_id + "'");
    }
    area_to_zone_[postcode_area] = zone_id;
}

void PostcodeZoneResolver::loadFromJson(const json& mapping) {
    if (!mapping.is_object()) {
        throw TariffError(ErrorCode::MALFORMED_TARIFF_DATA, "Zone mapping must be an object");
    }
    std::map<std::string, std::string> previous;
    previous.swap(area_to_zone_);
    try {
        for (auto it = mapping.begin(); it != mapping.end(); ++it) {
            if (!it.value().is_string()) {
                throw TariffError(ErrorCode::MALFORMED_TARIFF_DATA,
                                  "Zone mapping for '" + it.key() + "' must be a string");
            }
            addMapping(it.key(), it.value().get<std::string>());
        }
    } catch (const TariffError&) {
        area_to_zone_.swap(previous);
        throw;
    }
}

void PostcodeZoneResolver::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw TariffError(ErrorCode::MALFORMED_TARIFF_DATA, "Cannot open zone mapping file: " + path);
    }
    json mapping;
    try {
        mapping = json::parse(in);
    } catch (const json::parse_error& e) {
        throw TariffError(ErrorCode::MALFORMED_TARIFF_DATA,
                          "Zone mapping file " + path + " is not valid JSON: " + e.what());
    }
    loadFromJson(mapping);
}

std::string PostcodeZoneResolver::resolveZone(const AddressQuery& query) const {
    std::string postcode = normalizePostcode(query.postcode);
    if (postcode.empty()) {
        throw TariffError(ErrorCode::ADDRESS_NOT_FOUND,
                          "Postcode '" + query.postcode + "' is not a valid Dutch postcode");
    }
    if (query.house_number < 1) {
        throw TariffError(ErrorCode::ADDRESS_NOT_FOUND, "House number must be greater than 0");
    }

    auto it = area_to_zone_.find(postcode.substr(0, 4));
    if (it == area_to_zone_.end()) {
        throw TariffError(ErrorCode::ZONE_NOT_MAPPED,
                          "No parking zone mapped for postcode " + postcode);
    }
    return it->second;
}

} // namespace nprpark

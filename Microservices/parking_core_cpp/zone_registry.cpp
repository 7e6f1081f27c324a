#include "zone_registry.h"
#include "dataset_loader.h"
#include "errors.h"
#include "logger.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <set>

namespace nprpark {

namespace {

std::string toLower(const std::string& text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

ZoneSummary summarize(const Zone& zone, size_t structure_count) {
    ZoneSummary summary;
    summary.zone_id = zone.zone_id;
    summary.description = zone.description;
    summary.usage_category = zone.usage_category;
    summary.valid_from = zone.valid_from;
    summary.has_valid_to = zone.has_valid_to;
    summary.valid_to = zone.valid_to;
    summary.structure_count = structure_count;
    return summary;
}

} // namespace

bool Snapshot::hasZone(const std::string& zone_id) const {
    for (const auto& zone : zones) {
        if (zone.zone_id == zone_id) {
            return true;
        }
    }
    return false;
}

void Snapshot::requireZone(const std::string& zone_id) const {
    if (!hasZone(zone_id)) {
        throw TariffError(ErrorCode::UNKNOWN_ZONE, "Zone '" + zone_id + "' is not known");
    }
}

std::vector<const TariffStructure*> Snapshot::findStructures(const std::string& zone_id,
                                                             CivilTime from, CivilTime to) const {
    requireZone(zone_id);

    std::vector<const TariffStructure*> result;
    auto it = structures.find(zone_id);
    if (it == structures.end()) {
        return result;
    }
    for (const auto& structure : it->second) {
        if (structure.overlaps(from, to)) {
            result.push_back(&structure);
        }
    }
    return result;
}

std::vector<ZoneSummary> Snapshot::listZones() const {
    std::vector<ZoneSummary> result;
    for (const auto& zone : zones) {
        auto it = structures.find(zone.zone_id);
        result.push_back(summarize(zone, it == structures.end() ? 0 : it->second.size()));
    }
    return result;
}

std::vector<ZoneSummary> Snapshot::searchZones(const std::string& term) const {
    std::string needle = toLower(term);
    std::vector<ZoneSummary> result;
    for (const auto& summary : listZones()) {
        if (toLower(summary.zone_id).find(needle) != std::string::npos ||
            toLower(summary.description).find(needle) != std::string::npos ||
            toLower(summary.usage_category).find(needle) != std::string::npos) {
            result.push_back(summary);
        }
    }
    return result;
}

std::vector<TariffStructure> Snapshot::structuresForZone(const std::string& zone_id) const {
    requireZone(zone_id);
    auto it = structures.find(zone_id);
    if (it == structures.end()) {
        return std::vector<TariffStructure>();
    }
    return it->second;
}

std::vector<TariffStructure> Snapshot::structuresForZone(const std::string& zone_id,
                                                         CivilTime date) const {
    std::vector<TariffStructure> result;
    for (const auto* structure : findStructures(zone_id, date, date + MINUTES_PER_DAY)) {
        result.push_back(*structure);
    }
    return result;
}

bool Snapshot::isZoneValidAt(const std::string& zone_id, CivilTime t) const {
    for (const auto& zone : zones) {
        if (zone.zone_id == zone_id && zone.isValidAt(t)) {
            return true;
        }
    }
    return false;
}

bool Snapshot::isZoneValidDuring(const std::string& zone_id, CivilTime from, CivilTime to) const {
    if (to <= from) {
        return isZoneValidAt(zone_id, from);
    }
    // Записи одной зоны отсортированы по valid_from и не пересекаются
    CivilTime cursor = from;
    for (const auto& zone : zones) {
        if (zone.zone_id != zone_id || !zone.isValidAt(cursor)) {
            continue;
        }
        if (!zone.has_valid_to || zone.valid_to >= to) {
            return true;
        }
        cursor = zone.valid_to;
    }
    return false;
}

size_t Snapshot::zoneCount() const {
    std::set<std::string> ids;
    for (const auto& zone : zones) {
        ids.insert(zone.zone_id);
    }
    return ids.size();
}

ZoneRegistry::ZoneRegistry() : snapshot_(std::make_shared<Snapshot>()) {}

void ZoneRegistry::publish(std::shared_ptr<const Snapshot> snapshot) {
    if (!snapshot) {
        throw TariffError(ErrorCode::MALFORMED_TARIFF_DATA, "Refusing to publish an empty snapshot pointer");
    }
    std::atomic_store(&snapshot_, snapshot);
}

void ZoneRegistry::reload(const std::string& dataset_path) {
    try {
        std::shared_ptr<const Snapshot> fresh = loadDatasetFile(dataset_path);
        publish(fresh);
        logEvent(LogLevel::INFO, "Tariff dataset published", "", {
            {"path", dataset_path},
            {"records", fresh->record_count},
            {"zones", fresh->zoneCount()}
        });
    } catch (const TariffError& e) {
        logEvent(LogLevel::ERROR, "Tariff dataset rejected, keeping previous snapshot", "", {
            {"path", dataset_path},
            {"error", e.what()}
        });
        throw;
    }
}

std::shared_ptr<const Snapshot> ZoneRegistry::snapshot() const {
    return current();
}

std::shared_ptr<const Snapshot> ZoneRegistry::current() const {
    return std::atomic_load(&snapshot_);
}

std::vector<TariffStructure> ZoneRegistry::findStructures(const std::string& zone_id,
                                                          CivilTime from, CivilTime to) const {
    std::shared_ptr<const Snapshot> snap = current();
    std::vector<TariffStructure> result;
    for (const auto* structure : snap->findStructures(zone_id, from, to)) {
        result.push_back(*structure);
    }
    return result;
}

std::vector<ZoneSummary> ZoneRegistry::listZones() const {
    return current()->listZones();
}

std::vector<ZoneSummary> ZoneRegistry::searchZones(const std::string& term) const {
    return current()->searchZones(term);
}

size_t ZoneRegistry::zoneCount() const {
    return current()->zoneCount();
}

} // namespace nprpark

#pragma once

#include "tariff_model.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace nprpark {

// Неизменяемый снимок набора тарифов. После публикации не меняется;
// обновление набора - это новый снимок.
struct Snapshot {
    std::vector<Zone> zones;                                        // по zone_id, затем valid_from
    std::map<std::string, std::vector<TariffStructure>> structures; // по zone_id, по valid_from
    std::string source_path;
    std::string loaded_at;
    size_t record_count = 0;

    bool hasZone(const std::string& zone_id) const;

    // Структуры, пересекающиеся с [from, to), по valid_from
    std::vector<const TariffStructure*> findStructures(const std::string& zone_id,
                                                       CivilTime from, CivilTime to) const;

    std::vector<ZoneSummary> listZones() const;
    std::vector<ZoneSummary> searchZones(const std::string& term) const;
    std::vector<TariffStructure> structuresForZone(const std::string& zone_id) const;
    std::vector<TariffStructure> structuresForZone(const std::string& zone_id, CivilTime date) const;
    bool isZoneValidAt(const std::string& zone_id, CivilTime t) const;

    // Записи зоны без разрывов покрывают [from, to); при from == to - момент from
    bool isZoneValidDuring(const std::string& zone_id, CivilTime from, CivilTime to) const;

    // Число различных zone_id
    size_t zoneCount() const;

private:
    void requireZone(const std::string& zone_id) const;
};

class ZoneRegistry {
public:
    ZoneRegistry();

    // Атомарная замена снимка: читатели видят старый или новый, но не частичный
    void publish(std::shared_ptr<const Snapshot> snapshot);

    // Строит новый снимок из файла; при ошибке текущий снимок остаётся
    void reload(const std::string& dataset_path);

    std::shared_ptr<const Snapshot> snapshot() const;

    // Удобные обёртки над текущим снимком
    std::vector<TariffStructure> findStructures(const std::string& zone_id,
                                                CivilTime from, CivilTime to) const;
    std::vector<ZoneSummary> listZones() const;
    std::vector<ZoneSummary> searchZones(const std::string& term) const;
    size_t zoneCount() const;

private:
    std::shared_ptr<const Snapshot> current() const;

    std::shared_ptr<const Snapshot> snapshot_;
};

} // namespace nprpark

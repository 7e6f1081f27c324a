#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace nprpark {

struct AddressQuery {
    std::string postcode;
    int house_number = 0;
    std::string house_letter;
    std::string house_number_addition;
};

// Внешний геокодер: адрес -> zone_id.
// Ошибки: TariffError с ADDRESS_NOT_FOUND или ZONE_NOT_MAPPED.
class AddressResolver {
public:
    virtual ~AddressResolver() {}

    virtual std::string resolveZone(const AddressQuery& query) const = 0;
};

// Таблица "цифровая часть почтового индекса (4 цифры) -> zone_id"
class PostcodeZoneResolver : public AddressResolver {
public:
    PostcodeZoneResolver();

    // {"1012": "ZONE-ID", ...}
    void loadFromJson(const nlohmann::json& mapping);
    void loadFromFile(const std::string& path);
    void addMapping(const std::string& postcode_area, const std::string& zone_id);

    std::string resolveZone(const AddressQuery& query) const override;

    size_t size() const { return area_to_zone_.size(); }

    // "1012 ab" -> "1012AB"; пустая строка если формат не NNNNLL
    static std::string normalizePostcode(const std::string& postcode);

private:
    std::map<std::string, std::string> area_to_zone_;
};

} // namespace nprpark

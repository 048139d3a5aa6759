#include "redaction/pii_types.h"

#include <unordered_map>

namespace shroud {
namespace redaction {

std::string PiiTypeUtils::toString(PiiType type) {
    switch (type) {
        case PiiType::PERSON: return "PERSON";
        case PiiType::EMAIL: return "EMAIL";
        case PiiType::PHONE: return "PHONE";
        case PiiType::ADDRESS: return "ADDRESS";
        case PiiType::SSN: return "SSN";
        case PiiType::CREDIT_CARD: return "CREDIT_CARD";
        case PiiType::BANK_ACCOUNT: return "BANK_ACCOUNT";
        case PiiType::DATE_OF_BIRTH: return "DATE_OF_BIRTH";
        case PiiType::PASSPORT: return "PASSPORT";
        case PiiType::DRIVER_LICENSE: return "DRIVER_LICENSE";
        case PiiType::IP_ADDRESS: return "IP_ADDRESS";
        case PiiType::URL: return "URL";
        case PiiType::USERNAME: return "USERNAME";
        case PiiType::PASSWORD: return "PASSWORD";
        case PiiType::MEDICAL_ID: return "MEDICAL_ID";
        case PiiType::NATIONAL_ID: return "NATIONAL_ID";
        case PiiType::TAX_ID: return "TAX_ID";
        default: return "UNKNOWN";
    }
}

PiiType PiiTypeUtils::fromString(const std::string& name) {
    for (PiiType type : allTypes()) {
        if (toString(type) == name) return type;
    }
    return PiiType::UNKNOWN;
}

int PiiTypeUtils::riskWeight(PiiType type) {
    switch (type) {
        case PiiType::PASSWORD: return 30;
        case PiiType::SSN: return 25;
        case PiiType::CREDIT_CARD: return 25;
        case PiiType::BANK_ACCOUNT: return 20;
        case PiiType::PASSPORT: return 20;
        case PiiType::MEDICAL_ID: return 20;
        case PiiType::NATIONAL_ID: return 20;
        case PiiType::TAX_ID: return 20;
        case PiiType::DRIVER_LICENSE: return 15;
        case PiiType::PHONE: return 10;
        case PiiType::ADDRESS: return 10;
        case PiiType::PERSON: return 5;
        case PiiType::EMAIL: return 5;
        case PiiType::DATE_OF_BIRTH: return 5;
        case PiiType::IP_ADDRESS: return 5;
        case PiiType::USERNAME: return 5;
        case PiiType::URL: return 2;
        default: return 5;
    }
}

std::optional<PiiType> PiiTypeUtils::fromModelLabel(const std::string& tag) {
    static const std::unordered_map<std::string, PiiType> model_labels = {
        {"ACCOUNTNUM", PiiType::BANK_ACCOUNT},
        {"BUILDINGNUM", PiiType::ADDRESS},
        {"CITY", PiiType::ADDRESS},
        {"STREET", PiiType::ADDRESS},
        {"ZIPCODE", PiiType::ADDRESS},
        {"CREDITCARDNUMBER", PiiType::CREDIT_CARD},
        {"DATEOFBIRTH", PiiType::DATE_OF_BIRTH},
        {"DRIVERLICENSENUM", PiiType::DRIVER_LICENSE},
        {"GIVENNAME", PiiType::PERSON},
        {"SURNAME", PiiType::PERSON},
        {"IDCARDNUM", PiiType::NATIONAL_ID},
        {"SOCIALNUM", PiiType::SSN},
        {"TAXNUM", PiiType::TAX_ID},
        {"TELEPHONENUM", PiiType::PHONE},
    };

    auto it = model_labels.find(tag);
    if (it != model_labels.end()) {
        return it->second;
    }
    // Canonical names (EMAIL, PASSWORD, USERNAME, URL, ...) map to themselves
    PiiType type = fromString(tag);
    if (type != PiiType::UNKNOWN) {
        return type;
    }
    return std::nullopt;
}

const std::vector<PiiType>& PiiTypeUtils::allTypes() {
    static const std::vector<PiiType> types = {
        PiiType::PERSON, PiiType::EMAIL, PiiType::PHONE, PiiType::ADDRESS,
        PiiType::SSN, PiiType::CREDIT_CARD, PiiType::BANK_ACCOUNT,
        PiiType::DATE_OF_BIRTH, PiiType::PASSPORT, PiiType::DRIVER_LICENSE,
        PiiType::IP_ADDRESS, PiiType::URL, PiiType::USERNAME, PiiType::PASSWORD,
        PiiType::MEDICAL_ID, PiiType::NATIONAL_ID, PiiType::TAX_ID
    };
    return types;
}

} // namespace redaction
} // namespace shroud

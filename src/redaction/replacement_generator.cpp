#include "redaction/replacement_generator.h"
#include "utils/crypto_utils.h"

#include <cctype>
#include <random>
#include <string>
#include <vector>

namespace shroud {
namespace redaction {

namespace {

const std::vector<std::string> kFirstNames = {
    "James", "Mary", "Robert", "Patricia", "John", "Jennifer", "Michael", "Linda",
    "David", "Elizabeth", "William", "Barbara", "Richard", "Susan", "Joseph", "Jessica",
    "Thomas", "Sarah", "Charles", "Karen", "Daniel", "Lisa", "Matthew", "Nancy",
    "Anthony", "Betty", "Mark", "Sandra", "Steven", "Ashley", "Andrew", "Emily",
    "Joshua", "Michelle", "Kevin", "Amanda", "Brian", "Melissa", "George", "Rebecca"
};

const std::vector<std::string> kLastNames = {
    "Smith", "Johnson", "Williams", "Brown", "Jones", "Garcia", "Miller", "Davis",
    "Rodriguez", "Martinez", "Hernandez", "Lopez", "Gonzalez", "Wilson", "Anderson", "Thomas",
    "Taylor", "Moore", "Jackson", "Martin", "Lee", "Perez", "Thompson", "White",
    "Harris", "Sanchez", "Clark", "Ramirez", "Lewis", "Robinson", "Walker", "Young",
    "Allen", "King", "Wright", "Scott", "Torres", "Nguyen", "Hill", "Flores"
};

const std::vector<std::string> kStreetNames = {
    "Maple", "Oak", "Cedar", "Pine", "Elm", "Washington", "Lake", "Hill",
    "Park", "Sunset", "Highland", "Church", "Meadow", "River", "Forest", "Spring",
    "Ridge", "Valley", "Mill", "Willow"
};

const std::vector<std::string> kStreetSuffixes = {
    "Street", "Avenue", "Road", "Lane", "Drive", "Court", "Boulevard", "Way", "Place", "Terrace"
};

const std::vector<std::string> kEmailDomains = {
    "example.com", "example.net", "example.org", "mail.test"
};

const std::vector<std::string> kUrlWords = {
    "amber", "brisk", "cobalt", "dapper", "ember", "frosty", "gentle", "hollow",
    "ivory", "jolly", "lunar", "mellow", "nimble", "orchid", "quiet", "rustic"
};

const std::vector<std::string> kUrlNouns = {
    "harbor", "meadow", "lantern", "summit", "canyon", "orchard", "river", "garden"
};

const std::vector<std::string> kTlds = {"com", "net", "org", "info", "biz"};

class SeededRandom {
public:
    explicit SeededRandom(uint32_t seed) : gen_(seed) {}

    // Modulo over raw engine output keeps results identical across standard libraries
    uint32_t below(uint32_t n) { return static_cast<uint32_t>(gen_() % n); }

    uint32_t between(uint32_t lo, uint32_t hi) { return lo + below(hi - lo + 1); }

    const std::string& pick(const std::vector<std::string>& items) {
        return items[below(static_cast<uint32_t>(items.size()))];
    }

    std::string digits(size_t n) {
        std::string out;
        for (size_t i = 0; i < n; ++i) out.push_back(static_cast<char>('0' + below(10)));
        return out;
    }

    std::string upper(size_t n) {
        std::string out;
        for (size_t i = 0; i < n; ++i) out.push_back(static_cast<char>('A' + below(26)));
        return out;
    }

private:
    std::mt19937 gen_;
};

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

int daysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && ((year % 4 == 0 && year % 100 != 0) || year % 400 == 0)) return 29;
    return days[month - 1];
}

// Birth dates are derived against a fixed reference year so output does not drift with the clock
constexpr int kReferenceYear = 2025;

std::string fakeDateOfBirth(SeededRandom& rng) {
    int age = static_cast<int>(rng.between(18, 80));
    int year = kReferenceYear - age;
    int month = static_cast<int>(rng.between(1, 12));
    int day = static_cast<int>(rng.between(1, static_cast<uint32_t>(daysInMonth(year, month))));
    return std::to_string(month) + "/" + std::to_string(day) + "/" + std::to_string(year);
}

std::string fakePhone(SeededRandom& rng) {
    std::string area = std::to_string(rng.between(2, 9)) + rng.digits(2);
    std::string exchange = std::to_string(rng.between(2, 9)) + rng.digits(2);
    return "(" + area + ") " + exchange + "-" + rng.digits(4);
}

std::string fakeEmail(SeededRandom& rng) {
    std::string first = lower(rng.pick(kFirstNames));
    std::string last = lower(rng.pick(kLastNames));
    static const char separators[] = {'.', '_'};
    return first + separators[rng.below(2)] + last + std::to_string(rng.below(100)) +
           "@" + rng.pick(kEmailDomains);
}

std::string fakeUsername(SeededRandom& rng) {
    std::string first = rng.pick(kFirstNames);
    std::string last = rng.pick(kLastNames);
    return "@" + first + "_" + last + std::to_string(rng.below(100));
}

std::string fakeIpv4(SeededRandom& rng) {
    return std::to_string(rng.between(1, 254)) + "." + std::to_string(rng.below(256)) + "." +
           std::to_string(rng.below(256)) + "." + std::to_string(rng.between(1, 254));
}

std::string fakeUrl(SeededRandom& rng) {
    return "https://" + rng.pick(kUrlWords) + "-" + rng.pick(kUrlNouns) + "." + rng.pick(kTlds) + "/";
}

} // namespace

uint32_t ReplacementGenerator::seedFor(const std::string& original, const std::string& salt) {
    std::string hex = utils::hmacSha256Hex(salt, original);
    return static_cast<uint32_t>(std::stoul(hex.substr(0, 8), nullptr, 16));
}

std::string ReplacementGenerator::generate(const std::string& original, PiiType type, const std::string& salt) {
    SeededRandom rng(seedFor(original, salt));

    switch (type) {
        case PiiType::PERSON:
            return rng.pick(kFirstNames) + " " + rng.pick(kLastNames);
        case PiiType::EMAIL:
            return fakeEmail(rng);
        case PiiType::PHONE:
            return fakePhone(rng);
        case PiiType::ADDRESS:
            return std::to_string(rng.between(1, 9999)) + " " + rng.pick(kStreetNames) + " " +
                   rng.pick(kStreetSuffixes);
        case PiiType::SSN:
            return rng.digits(3) + "-" + rng.digits(2) + "-" + rng.digits(4);
        case PiiType::CREDIT_CARD:
            return rng.digits(4) + "-" + rng.digits(4) + "-" + rng.digits(4) + "-" + rng.digits(4);
        case PiiType::BANK_ACCOUNT:
            return rng.digits(8);
        case PiiType::DATE_OF_BIRTH:
            return fakeDateOfBirth(rng);
        case PiiType::PASSPORT:
            return rng.upper(2) + rng.digits(7);
        case PiiType::DRIVER_LICENSE:
            return rng.upper(1) + rng.digits(7);
        case PiiType::IP_ADDRESS:
            return fakeIpv4(rng);
        case PiiType::URL:
            return fakeUrl(rng);
        case PiiType::USERNAME:
            return fakeUsername(rng);
        case PiiType::PASSWORD:
            return "[REDACTED_PASSWORD]";
        case PiiType::MEDICAL_ID:
            return "MED" + rng.digits(8);
        case PiiType::NATIONAL_ID:
            return rng.digits(10);
        case PiiType::TAX_ID:
            return rng.digits(2) + "-" + rng.digits(7);
        default:
            return "[REDACTED]";
    }
}

std::string ReplacementGenerator::simple(PiiType type) {
    return "[" + PiiTypeUtils::toString(type) + "]";
}

} // namespace redaction
} // namespace shroud

/**
 * Copyright (c) 2024, Timothy Stack
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 * * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * * Neither the name of Timothy Stack nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE REGENTS AND CONTRIBUTORS ''AS IS'' AND ANY
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE REGENTS OR CONTRIBUTORS BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 * @file fake_data.cc
 */

#include "fake_data.hh"

#include "base/string_util.hh"
#include "fmt/format.h"
#include "hasher.hh"

namespace piiguard {

static const std::vector<const char*> FIRST_NAMES_EN = {
    "James",    "Robert",    "John",      "Michael",  "David",
    "William",  "Richard",   "Joseph",    "Thomas",   "Christopher",
    "Charles",  "Daniel",    "Matthew",   "Anthony",  "Mark",
    "Donald",   "Steven",    "Andrew",    "Paul",     "Joshua",
    "Kenneth",  "Kevin",     "Brian",     "George",   "Timothy",
    "Ronald",   "Edward",    "Jason",     "Jeffrey",  "Ryan",
    "Jacob",    "Gary",      "Nicholas",  "Eric",     "Jonathan",
    "Stephen",  "Larry",     "Justin",    "Scott",    "Brandon",
    "Benjamin", "Samuel",    "Raymond",   "Gregory",  "Frank",
    "Alexander", "Patrick",  "Jack",      "Dennis",   "Jerry",
    "Tyler",

    "Mary",     "Patricia",  "Jennifer",  "Linda",    "Elizabeth",
    "Barbara",  "Susan",     "Jessica",   "Sarah",    "Karen",
    "Lisa",     "Nancy",     "Betty",     "Margaret", "Sandra",
    "Ashley",   "Kimberly",  "Emily",     "Donna",    "Michelle",
    "Dorothy",  "Carol",     "Amanda",    "Melissa",  "Deborah",
    "Stephanie", "Rebecca",  "Sharon",    "Laura",    "Cynthia",
    "Kathleen", "Amy",       "Angela",    "Shirley",  "Anna",
    "Brenda",   "Pamela",    "Emma",      "Nicole",   "Helen",
    "Samantha", "Katherine", "Christine", "Debra",    "Rachel",
    "Carolyn",  "Janet",     "Catherine", "Maria",    "Heather",
    "Diane",    "Ruth",
};

static const std::vector<const char*> FIRST_NAMES_ES = {
    "José",   "Carlos",  "Miguel",    "Juan",      "Luis",
    "Antonio", "Francisco", "Pedro",  "Manuel",    "Alejandro",
    "Ricardo", "Fernando", "Roberto", "Diego",     "Andrés",
    "María",  "Carmen",  "Ana",       "Isabel",    "Rosa",
    "Patricia", "Laura", "Elena",     "Lucia",     "Marta",
    "Paula",  "Sandra",  "Cristina",  "Raquel",    "Teresa",
};

static const std::vector<const char*> FIRST_NAMES_FR = {
    "Jean",    "Pierre",    "Michel",   "André",    "Philippe",
    "Jacques", "Bernard",   "François", "Louis",    "Henri",
    "Marie",   "Jeanne",    "Catherine", "Françoise", "Monique",
    "Nicole",  "Sylvie",    "Nathalie", "Isabelle", "Sophie",
};

static const std::vector<const char*> FIRST_NAMES_DE = {
    "Hans",    "Klaus",    "Wolfgang", "Peter",     "Michael",
    "Thomas",  "Andreas",  "Stefan",   "Markus",    "Christian",
    "Anna",    "Maria",    "Elisabeth", "Monika",   "Ursula",
    "Petra",   "Sabine",   "Claudia",  "Susanne",   "Birgit",
};

static const std::vector<const char*> FIRST_NAMES_JP = {
    "太郎", "次郎", "健太", "大輔", "翔太", "拓也", "直樹",
    "雄太", "達也", "剛",   "花子", "美咲", "さくら", "優子",
    "真由美", "愛", "美穂", "恵",   "裕子", "明美",
};

static const std::vector<const char*> LAST_NAMES_EN = {
    "Smith",    "Johnson",  "Williams", "Brown",      "Jones",
    "Garcia",   "Miller",   "Davis",    "Rodriguez",  "Martinez",
    "Hernandez", "Lopez",   "Gonzalez", "Wilson",     "Anderson",
    "Thomas",   "Taylor",   "Moore",    "Jackson",    "Martin",
    "Lee",      "Perez",    "Thompson", "White",      "Harris",
    "Sanchez",  "Clark",    "Ramirez",  "Lewis",      "Robinson",
    "Walker",   "Young",    "Allen",    "King",       "Wright",
    "Scott",    "Torres",   "Nguyen",   "Hill",       "Flores",
    "Green",    "Adams",    "Nelson",   "Baker",      "Hall",
    "Rivera",   "Campbell", "Mitchell", "Carter",     "Roberts",
    "Turner",   "Phillips", "Evans",    "Collins",    "Edwards",
    "Stewart",  "Morris",   "Rogers",   "Reed",       "Cook",
    "Morgan",   "Bell",     "Murphy",   "Bailey",     "Cooper",
    "Richardson", "Cox",    "Howard",   "Ward",       "Peterson",
    "Gray",     "James",    "Watson",   "Brooks",     "Kelly",
};

static const std::vector<const char*> LAST_NAMES_ES = {
    "García",  "Rodríguez", "Martínez", "López",   "González",
    "Hernández", "Pérez",   "Sánchez",  "Ramírez", "Torres",
    "Flores",  "Rivera",    "Gómez",    "Díaz",    "Reyes",
    "Morales", "Jiménez",   "Ruiz",     "Álvarez", "Mendoza",
};

static const std::vector<const char*> LAST_NAMES_FR = {
    "Martin", "Bernard", "Dubois",  "Thomas",   "Robert",
    "Richard", "Petit",  "Durand",  "Leroy",    "Moreau",
    "Simon",  "Laurent", "Lefebvre", "Michel",  "Garcia",
};

static const std::vector<const char*> LAST_NAMES_DE = {
    "Müller", "Schmidt", "Schneider", "Fischer", "Weber",
    "Meyer",  "Wagner",  "Becker",    "Schulz",  "Hoffmann",
    "Schäfer", "Koch",   "Bauer",     "Richter", "Klein",
};

static const std::vector<const char*> LAST_NAMES_JP = {
    "佐藤", "鈴木", "高橋", "田中", "伊藤", "渡辺", "山本",
    "中村", "小林", "加藤", "吉田", "山田", "佐々木", "山口",
    "松本", "井上", "木村", "林",   "斎藤", "清水",
};

static const std::vector<const char*> STREET_NAMES = {
    "Main",     "Oak",      "Maple",     "Cedar",     "Pine",
    "Elm",      "Washington", "Lake",    "Hill",      "Park",
    "View",     "Forest",   "River",     "Spring",    "Valley",
    "Sunset",   "Highland", "Broadway",  "Madison",   "Jefferson",
    "Lincoln",  "Franklin", "Adams",     "Jackson",   "Wilson",
    "Harrison", "Tyler",    "Polk",      "Taylor",    "Fillmore",
    "Pierce",
};

static const std::vector<const char*> STREET_SUFFIXES = {
    "Street", "Avenue", "Road",   "Boulevard", "Drive",
    "Lane",   "Way",    "Court",  "Place",     "Circle",
    "Trail",  "Parkway", "Commons", "Square",  "Terrace",
};

struct city_info {
    const char* ci_city;
    const char* ci_region;
    const char* ci_postal;
};

static const std::vector<city_info> US_CITIES = {
    {"New York", "NY", "10001"},     {"Los Angeles", "CA", "90001"},
    {"Chicago", "IL", "60601"},      {"Houston", "TX", "77001"},
    {"Phoenix", "AZ", "85001"},      {"Philadelphia", "PA", "19101"},
    {"San Antonio", "TX", "78201"},  {"San Diego", "CA", "92101"},
    {"Dallas", "TX", "75201"},       {"San Jose", "CA", "95101"},
    {"Austin", "TX", "78701"},       {"Jacksonville", "FL", "32099"},
    {"Fort Worth", "TX", "76101"},   {"Columbus", "OH", "43085"},
    {"Charlotte", "NC", "28201"},    {"San Francisco", "CA", "94102"},
    {"Indianapolis", "IN", "46201"}, {"Seattle", "WA", "98101"},
    {"Denver", "CO", "80201"},       {"Boston", "MA", "02101"},
    {"Nashville", "TN", "37201"},    {"Detroit", "MI", "48201"},
    {"Portland", "OR", "97201"},     {"Las Vegas", "NV", "89101"},
    {"Memphis", "TN", "38101"},      {"Louisville", "KY", "40201"},
    {"Baltimore", "MD", "21201"},    {"Milwaukee", "WI", "53201"},
    {"Albuquerque", "NM", "87101"},  {"Tucson", "AZ", "85701"},
};

static const std::vector<city_info> UK_CITIES = {
    {"London", "Greater London", "EC1A"},
    {"Birmingham", "West Midlands", "B1"},
    {"Manchester", "Greater Manchester", "M1"},
    {"Glasgow", "Scotland", "G1"},
    {"Liverpool", "Merseyside", "L1"},
    {"Bristol", "Bristol", "BS1"},
    {"Sheffield", "South Yorkshire", "S1"},
    {"Leeds", "West Yorkshire", "LS1"},
    {"Edinburgh", "Scotland", "EH1"},
    {"Leicester", "Leicestershire", "LE1"},
};

static const std::vector<city_info> CA_CITIES = {
    {"Toronto", "ON", "M5V"},
    {"Montreal", "QC", "H2Y"},
    {"Vancouver", "BC", "V6B"},
    {"Calgary", "AB", "T2P"},
    {"Edmonton", "AB", "T5J"},
    {"Ottawa", "ON", "K1P"},
    {"Winnipeg", "MB", "R3C"},
    {"Quebec City", "QC", "G1R"},
    {"Hamilton", "ON", "L8P"},
    {"Halifax", "NS", "B3H"},
};

static const std::string UK_POSTCODE_LETTERS = "ABCDEFGHJKLMNPRSTUVWXY";
static const std::string CA_POSTCODE_LETTERS = "ABCEGHJKLMNPRSTVWXYZ";

static const std::vector<const char*> COMPANY_PREFIXES = {
    "Global",   "United",   "National",  "American", "International",
    "Pacific",  "Atlantic", "Northern",  "Southern", "Western",
    "Eastern",  "Central",  "Premier",   "Prime",    "Elite",
    "Advanced", "Modern",   "Dynamic",   "Strategic",
};

static const std::vector<const char*> COMPANY_BASES = {
    "Tech",     "Systems",  "Solutions", "Industries", "Services",
    "Group",    "Corp",     "Holdings",  "Enterprises", "Partners",
    "Associates", "Networks", "Consulting", "Digital", "Media",
    "Software", "Data",     "Cloud",     "Labs",
};

static const std::vector<const char*> COMPANY_SUFFIXES = {
    "Inc", "LLC", "Corp", "Ltd", "Co", "Group", "Holdings", "International",
};

static const std::vector<const char*> EMAIL_DOMAINS = {
    "example.com",
    "test.org",
    "sample.net",
    "demo.io",
    "fake.email",
    "mailtest.com",
    "testmail.org",
    "samplemail.net",
    "fakemail.io",
    "corporate.test",
    "business.example",
    "company.demo",
};

static const std::string LOWERCASE_LETTERS = "abcdefghijklmnopqrstuvwxyz";

std::mt19937_64
value_seeded_rng(const std::optional<int64_t>& seed, const std::string& value)
{
    auto key = seed ? fmt::format(FMT_STRING("{}:{}"), seed.value(), value)
                    : value;
    auto digest = md5_hex(key);

    return std::mt19937_64(std::stoull(digest.substr(0, 8), nullptr, 16));
}

static std::mt19937_64
instance_rng(const std::optional<int64_t>& seed)
{
    if (seed) {
        return std::mt19937_64(seed.value());
    }

    std::random_device rd;

    return std::mt19937_64(rd());
}

fake_data_generator::fake_data_generator(std::optional<int64_t> seed,
                                         std::string locale)
    : fdg_seed(seed), fdg_locale(std::move(locale)),
      fdg_rng(instance_rng(seed))
{
}

template<typename F>
auto
fake_data_generator::with_rng(const original_t& original, F func)
{
    if (original && !original->empty()) {
        auto rng = value_seeded_rng(this->fdg_seed, original.value());

        return func(rng);
    }

    return func(this->fdg_rng);
}

fake_data_generator::name_lists
fake_data_generator::names_for_locale() const
{
    if (startswith(this->fdg_locale, "es")) {
        return {FIRST_NAMES_ES, LAST_NAMES_ES};
    }
    if (startswith(this->fdg_locale, "fr")) {
        return {FIRST_NAMES_FR, LAST_NAMES_FR};
    }
    if (startswith(this->fdg_locale, "de")) {
        return {FIRST_NAMES_DE, LAST_NAMES_DE};
    }
    if (startswith(this->fdg_locale, "ja")) {
        return {FIRST_NAMES_JP, LAST_NAMES_JP};
    }

    return {FIRST_NAMES_EN, LAST_NAMES_EN};
}

std::string
fake_data_generator::first_name(const original_t& original)
{
    auto names = this->names_for_locale();

    return this->with_rng(original, [&names](std::mt19937_64& rng) {
        return std::string(rand_choice(rng, names.nl_first));
    });
}

std::string
fake_data_generator::last_name(const original_t& original)
{
    auto names = this->names_for_locale();

    return this->with_rng(original, [&names](std::mt19937_64& rng) {
        return std::string(rand_choice(rng, names.nl_last));
    });
}

std::string
fake_data_generator::full_name(const original_t& original)
{
    auto names = this->names_for_locale();

    return this->with_rng(original, [&names](std::mt19937_64& rng) {
        auto first = rand_choice(rng, names.nl_first);
        auto last = rand_choice(rng, names.nl_last);

        return fmt::format(FMT_STRING("{} {}"), first, last);
    });
}

std::string
fake_data_generator::email(const original_t& original)
{
    return this->with_rng(original, [](std::mt19937_64& rng) {
        std::string name;

        for (int lpc = 0; lpc < 8; lpc++) {
            name.push_back(rand_choice(rng, LOWERCASE_LETTERS));
        }

        return fmt::format(
            FMT_STRING("{}@{}"), name, rand_choice(rng, EMAIL_DOMAINS));
    });
}

std::string
fake_data_generator::phone(const original_t& original,
                           const std::string& format)
{
    return this->with_rng(original, [&format](std::mt19937_64& rng) {
        if (format == "us") {
            auto area = rand_between(rng, 200, 999);
            auto exchange = rand_between(rng, 200, 999);
            auto subscriber = rand_between(rng, 1000, 9999);

            return fmt::format(
                FMT_STRING("+1-{}-{}-{}"), area, exchange, subscriber);
        }
        if (format == "uk") {
            auto area = rand_between(rng, 20, 79);
            auto number = rand_between(rng, 10000000, 99999999);

            return fmt::format(FMT_STRING("+44-{}-{}"), area, number);
        }
        if (format == "intl") {
            auto country = rand_between(rng, 1, 99);
            auto number = rand_between(rng, 1000000000LL, 9999999999LL);

            return fmt::format(FMT_STRING("+{}-{}"), country, number);
        }

        auto exchange = rand_between(rng, 100, 999);
        auto subscriber = rand_between(rng, 1000, 9999);

        return fmt::format(FMT_STRING("+1-555-{}-{}"), exchange, subscriber);
    });
}

std::string
fake_data_generator::ssn(const original_t& original)
{
    return this->with_rng(original, [](std::mt19937_64& rng) {
        auto area = rand_between(rng, 100, 899);
        if (area == 666) {
            area = 667;
        }
        auto group = rand_between(rng, 10, 99);
        auto serial = rand_between(rng, 1000, 9999);

        return fmt::format(FMT_STRING("{}-{}-{}"), area, group, serial);
    });
}

fake_address
fake_data_generator::address(const original_t& original)
{
    const auto& locale = this->fdg_locale;

    return this->with_rng(original, [&locale](std::mt19937_64& rng) {
        fake_address retval;

        if (startswith(locale, "en_GB")) {
            const auto& ci = rand_choice(rng, UK_CITIES);
            auto digit = rand_between(rng, 1, 9);
            auto letter1 = rand_choice(rng, UK_POSTCODE_LETTERS);
            auto letter2 = rand_choice(rng, UK_POSTCODE_LETTERS);

            retval.fa_city = ci.ci_city;
            retval.fa_state = ci.ci_region;
            retval.fa_postal_code = fmt::format(FMT_STRING("{} {}{}{}"),
                                                ci.ci_postal,
                                                digit,
                                                letter1,
                                                letter2);
            retval.fa_country = "UK";
        } else if (startswith(locale, "en_CA") || startswith(locale, "fr_CA"))
        {
            const auto& ci = rand_choice(rng, CA_CITIES);
            auto digit1 = rand_between(rng, 1, 9);
            auto letter = rand_choice(rng, CA_POSTCODE_LETTERS);
            auto digit2 = rand_between(rng, 1, 9);

            retval.fa_city = ci.ci_city;
            retval.fa_state = ci.ci_region;
            retval.fa_postal_code = fmt::format(FMT_STRING("{} {}{}{}"),
                                                ci.ci_postal,
                                                digit1,
                                                letter,
                                                digit2);
            retval.fa_country = "Canada";
        } else {
            const auto& ci = rand_choice(rng, US_CITIES);
            auto zip = std::stol(ci.ci_postal) + rand_between(rng, 0, 99);

            retval.fa_city = ci.ci_city;
            retval.fa_state = ci.ci_region;
            retval.fa_postal_code = fmt::format(FMT_STRING("{:05}"), zip);
            retval.fa_country = "USA";
        }

        auto street_num = rand_between(rng, 1, 9999);
        auto street_name = rand_choice(rng, STREET_NAMES);
        auto street_suffix = rand_choice(rng, STREET_SUFFIXES);

        retval.fa_street = fmt::format(
            FMT_STRING("{} {} {}"), street_num, street_name, street_suffix);
        retval.fa_full = fmt::format(FMT_STRING("{}, {}, {} {}"),
                                     retval.fa_street,
                                     retval.fa_city,
                                     retval.fa_state,
                                     retval.fa_postal_code);

        return retval;
    });
}

std::string
fake_data_generator::street_address(const original_t& original)
{
    return this->address(original).fa_street;
}

std::string
fake_data_generator::city(const original_t& original)
{
    return this->address(original).fa_city;
}

std::string
fake_data_generator::company(const original_t& original)
{
    return this->with_rng(original, [](std::mt19937_64& rng) {
        std::string prefix;

        if (rand_uniform(rng, 0.0, 1.0) < 0.3) {
            prefix = fmt::format(FMT_STRING("{} "),
                                 rand_choice(rng, COMPANY_PREFIXES));
        }

        auto base = rand_choice(rng, COMPANY_BASES);
        auto suffix = rand_choice(rng, COMPANY_SUFFIXES);

        return fmt::format(FMT_STRING("{}{} {}"), prefix, base, suffix);
    });
}

std::string
fake_data_generator::date(const original_t& original,
                          int min_year,
                          int max_year)
{
    return this->with_rng(original, [min_year, max_year](std::mt19937_64& rng) {
        auto year = rand_between(rng, min_year, max_year);
        auto month = rand_between(rng, 1, 12);
        auto day = rand_between(rng, 1, 28);

        return fmt::format(FMT_STRING("{}-{:02}-{:02}"), year, month, day);
    });
}

static int
luhn_check_digit(const std::vector<int>& digits)
{
    int sum = 0;
    // the check digit will be appended, so the last digit here is doubled
    bool doubled = true;

    for (auto iter = digits.rbegin(); iter != digits.rend(); ++iter) {
        auto digit = *iter;

        if (doubled) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        doubled = !doubled;
    }

    return (10 - sum % 10) % 10;
}

std::string
fake_data_generator::credit_card(const original_t& original)
{
    static const std::vector<std::string> PREFIXES = {"4", "5", "37", "6011"};

    return this->with_rng(original, [](std::mt19937_64& rng) {
        const auto& prefix = rand_choice(rng, PREFIXES);
        std::vector<int> digits;

        for (auto ch : prefix) {
            digits.push_back(ch - '0');
        }

        int random_count;
        if (prefix == "4") {
            random_count = 14;
        } else if (prefix == "5") {
            digits.push_back(rand_between(rng, 1, 5));
            random_count = 13;
        } else {
            random_count = 12;
        }
        for (int lpc = 0; lpc < random_count; lpc++) {
            digits.push_back(rand_between(rng, 0, 9));
        }
        digits.push_back(luhn_check_digit(digits));

        std::string number;
        for (auto digit : digits) {
            number.push_back('0' + digit);
        }

        if (number.length() == 16) {
            return fmt::format(FMT_STRING("{} {} {} {}"),
                               number.substr(0, 4),
                               number.substr(4, 4),
                               number.substr(8, 4),
                               number.substr(12));
        }
        if (number.length() == 15) {
            return fmt::format(FMT_STRING("{} {} {}"),
                               number.substr(0, 4),
                               number.substr(4, 6),
                               number.substr(10));
        }

        return number;
    });
}

std::string
fake_data_generator::ip_address(const original_t& original, int version)
{
    return this->with_rng(original, [version](std::mt19937_64& rng) {
        if (version == 4) {
            std::vector<int64_t> firsts = {10, 172, 192, 0};

            firsts[3] = rand_between(rng, 1, 223);

            auto first = rand_choice(rng, firsts);
            auto second = rand_between(rng, 0, 255);
            auto third = rand_between(rng, 0, 255);
            auto fourth = rand_between(rng, 1, 254);

            return fmt::format(
                FMT_STRING("{}.{}.{}.{}"), first, second, third, fourth);
        }

        std::string retval;
        for (int lpc = 0; lpc < 8; lpc++) {
            if (lpc > 0) {
                retval.push_back(':');
            }
            retval += fmt::format(FMT_STRING("{:x}"),
                                  rand_between(rng, 0, 65535));
        }

        return retval;
    });
}

static std::string
first_char(const std::string& str)
{
    if (str.empty()) {
        return str;
    }

    return str.substr(0, utf8_char_size(str[0]));
}

std::string
fake_data_generator::username(const original_t& original)
{
    auto names = this->names_for_locale();

    return this->with_rng(original, [&names](std::mt19937_64& rng) {
        switch (rand_between(rng, 0, 3)) {
            case 0: {
                auto first = tolower(rand_choice(rng, names.nl_first));

                return fmt::format(
                    FMT_STRING("{}{}"), first, rand_between(rng, 1, 999));
            }
            case 1: {
                auto first = tolower(rand_choice(rng, names.nl_first));
                auto last = tolower(rand_choice(rng, names.nl_last));

                return fmt::format(FMT_STRING("{}_{}"), first, last);
            }
            case 2: {
                auto first = tolower(rand_choice(rng, names.nl_first));
                auto last = tolower(rand_choice(rng, names.nl_last));

                return fmt::format(
                    FMT_STRING("{}{}"), first_char(first), last);
            }
            default: {
                auto last = tolower(rand_choice(rng, names.nl_last));

                return fmt::format(
                    FMT_STRING("{}{}"), last, rand_between(rng, 10, 99));
            }
        }
    });
}

}  // namespace piiguard

// test_channel_expander.cpp – Archive policy → channel descriptor expansion.

#include "EpicsArchiveConfig/ChannelExpander.hpp"
#include "EpicsArchiveConfig/DbParser.hpp"
#include "EpicsArchiveConfig/Grammar.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace archcfg;

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

static ArchivePolicy policy(const char* value) {
    auto r = parseArchivePolicy(value);
    if (!r.ok())
        throw std::runtime_error(std::string("test policy failed to parse: ") + r.error);
    return *r.policy;
}

static void testBareChannel() {
    std::cout << "\n=== Test: Policy without properties ===\n";

    auto ch = expandPolicy("BL7:Mot:Parker:HROT.RBV", policy("monitor, 00:00:10"));
    CHECK(ch.size() == 1, "exactly one channel");
    if (ch.size() == 1) {
        CHECK(ch[0].name == "BL7:Mot:Parker:HROT.RBV", "channel named after the record");
        CHECK(ch[0].period == "00:00:10",              "period copied");
        CHECK(ch[0].mode == SampleMode::Monitor,       "mode copied");
    }
}

static void testPropertyChannels() {
    std::cout << "\n=== Test: Policy with properties ===\n";

    auto ch = expandPolicy("CF_BmLn:TT07108:T", policy("SCAN, 00:01:00, HIHI LOLO HIGH LOW"));
    const std::vector<std::string> names = {
        "CF_BmLn:TT07108:T.HIHI", "CF_BmLn:TT07108:T.LOLO",
        "CF_BmLn:TT07108:T.HIGH", "CF_BmLn:TT07108:T.LOW",
    };
    CHECK(ch.size() == names.size(), "one channel per property");
    for (std::size_t i = 0; i < ch.size() && i < names.size(); ++i) {
        CHECK(ch[i].name == names[i],          "channel " + names[i]);
        CHECK(ch[i].period == "00:01:00",      names[i] + " period");
        CHECK(ch[i].mode == SampleMode::Scan,  names[i] + " mode scan");
    }
}

static void testEmptyPropertyList() {
    std::cout << "\n=== Test: Present but empty property list ===\n";

    ArchivePolicy p = policy("monitor, 00:00:05");
    p.properties = std::vector<std::string>{};
    CHECK(p.properties.has_value() && p.propertyCount() == 0, "engaged empty list");
    CHECK(expandPolicy("rec", p).empty(), "no channel for an empty property list");
}

static void testRecordOrder() {
    std::cout << "\n=== Test: Record / attribute / property order ===\n";

    std::istringstream in(
        "record(ai, \"A\") {\n"
        "  field(DESC, \"field attributes never become channels\")\n"
        "  info(archive, \"monitor, 00:00:01, VAL RVAL\")\n"
        "  info(archive, \"scan, 00:00:02\")\n"
        "}\n"
        "record(ai, \"B\") {\n"
        "  field(EGU, \"mm\")\n"
        "}\n"
        "record(ai, \"C\") {\n"
        "  info(archive, \"monitor, 00:00:03\")\n"
        "}\n");
    const ParsedDatabase db = parseDatabase(in);
    const auto ch = expandChannels(db.records);

    const std::vector<ChannelDescriptor> expected = {
        {"A.VAL",  "00:00:01", SampleMode::Monitor},
        {"A.RVAL", "00:00:01", SampleMode::Monitor},
        {"A",      "00:00:02", SampleMode::Scan},
        {"C",      "00:00:03", SampleMode::Monitor},
    };
    CHECK(ch == expected, "flattened in record, attribute, property order");
    for (const auto& c : ch)
        std::cout << "  " << c.name << ' ' << c.period << ' ' << toString(c.mode) << '\n';

    CHECK(expandChannels({}).empty(), "no records, no channels");
}

// Every archive attribute yields max(1, properties) channels.
static void testChannelCount() {
    std::cout << "\n=== Test: Channel count per policy ===\n";

    const std::vector<std::pair<const char*, std::size_t>> cases = {
        {"monitor, 00:00:01",                1},
        {"monitor, 00:00:01,",               1},
        {"scan, 00:00:01, VAL",              1},
        {"scan, 00:00:01, VAL RVAL",         2},
        {"scan, 00:00:01, A B C D E F G H",  8},
    };
    for (const auto& [value, n] : cases) {
        Record rec;
        rec.type = "ai";
        rec.name = "R";
        rec.attributes.emplace_back(policy(value));
        rec.attributes.emplace_back(PlainAttribute{AttributeKind::Field, "DESC", "d"});
        CHECK(expandChannels({rec}).size() == n,
              std::string("\"") + value + "\" → " + std::to_string(n));
    }
}

int main() {
    try {
        testBareChannel();
        testPropertyChannels();
        testEmptyPropertyList();
        testRecordOrder();
        testChannelCount();
    } catch (const std::exception& e) {
        std::cerr << "FAIL unexpected exception: " << e.what() << '\n';
        ++failures;
    }

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}

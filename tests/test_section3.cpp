// test_section3.cpp – Tests for Section 3 (333) decoding: regional groups,
// sunshine with radiation, 907tt scoping and the 9-group family.
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_section3

#include "SynopCodec/Codec.hpp"
#include "SynopCodec/SpecLoader.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace synop;

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

static bool near(const std::optional<double>& v, double expected) {
    return v && std::fabs(*v - expected) < 1e-6;
}

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

// Land station at 00 UTC, wind in knots, precipitation in section 1 only.
static Report land(const Codec& codec, const std::string& section3) {
    return codec.decode("AAXX 01004 88889 12782 61506 333 " + section3);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: groups 0 to 4
// ─────────────────────────────────────────────────────────────────────────────
static void testRegionalAndTemperatures(const Codec& codec) {
    std::cout << "\n=== Test: Section 3 groups 0-4 ===\n";

    Report r = codec.decode("AAXX 20064 67005 12570 50402 60004 333 02434");
    const Observation* tg = r.get(Field::GroundMinimumTemperature);
    CHECK(tg && near(tg->value, 24) && tg->unit == "Cel", "region I: ground minimum 24 Cel");
    const Observation* local = r.get(Field::LocalPrecipitation);
    const Observation* character = local ? local->component("character") : nullptr;
    const Observation* when      = local ? local->component("time") : nullptr;
    CHECK(character && character->text == "Heavy intermittent", "region I: local precipitation character");
    CHECK(when && near(when->min, 3) && near(when->max, 4),      "region I: began 3-4 h ago");

    r = codec.decode("AAXX 20064 67005 12570 50402 60004 333 05534");
    tg = r.get(Field::GroundMinimumTemperature);
    CHECK(tg && near(tg->value, -5), "region I: tg 55 is -5 Cel");

    r = codec.decode("AAXX 20104 89646 46/// /2299 00113 29079 37708 42010 333 01268");
    const Observation* maxWind = r.get(Field::MaxWind);
    const Observation* dir   = maxWind ? maxWind->component("direction") : nullptr;
    const Observation* speed = maxWind ? maxWind->component("speed") : nullptr;
    CHECK(dir && near(dir->value, 120),                        "Antarctic: maximum wind from 120 deg");
    CHECK(speed && near(speed->value, 68) && speed->unit == "KT", "Antarctic: maximum wind 68 KT");
    const Observation* wind = r.get(Field::SurfaceWind);
    const Observation* surfaceSpeed = wind ? wind->component("speed") : nullptr;
    CHECK(surfaceSpeed && near(surfaceSpeed->value, 113), "Antarctic: surface wind 113 KT via extension");
    CHECK(r.get(Field::RelativeHumidity) && near(r.at(Field::RelativeHumidity).value, 79), "relative humidity 79 %");
    CHECK(r.get(Field::GeopotentialSurface) && near(r.at(Field::GeopotentialSurface).value, 925),
          "925 hPa surface");
    CHECK(r.get(Field::GeopotentialHeight) && near(r.at(Field::GeopotentialHeight).value, 1010),
          "925 hPa height 1010 gpm");

    r = land(codec, "01268");
    CHECK(contains(r.not_implemented, "01268"), "region III: group 0 not decoded");

    r = land(codec, "10178 21073 34101");
    CHECK(near(r.at(Field::MaximumTemperature).value, 17.8), "maximum temperature");
    CHECK(near(r.at(Field::MinimumTemperature).value, -7.3), "minimum temperature");
    const Observation* gs = r.get(Field::GroundState);
    CHECK(gs && gs->component("state") && gs->component("state")->code == 4, "ground state E = 4");

    r = land(codec, "3////");
    gs = r.get(Field::GroundState);
    CHECK(gs && !gs->available, "missing ground state is unavailable");

    r = land(codec, "41998");
    const Observation* snow  = r.get(Field::GroundStateSnow);
    const Observation* depth = snow ? snow->component("depth") : nullptr;
    CHECK(snow && snow->component("state")->code == 1, "snow ground state E' = 1");
    CHECK(depth && depth->available && !depth->flag("continuous"), "snow depth 998: cover not continuous");

    r = land(codec, "21073 10178");
    CHECK(contains(r.not_implemented, "10178"), "group 1 after group 2 not decoded");

    r = codec.decode("BBXX ZDLP 19004 99607 50455 41298 81307 333 34101");
    CHECK(contains(r.not_implemented, "34101"), "ground state from a ship not decoded");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: group 5 family
// ─────────────────────────────────────────────────────────────────────────────
static void testFive(const Codec& codec) {
    std::cout << "\n=== Test: Section 3 group 5 ===\n";

    Report r = land(codec, "50305");
    const Observation* evapo = r.get(Field::Evapotranspiration);
    CHECK(evapo && near(evapo->component("amount")->value, 3.0), "evapotranspiration 3.0 mm");
    CHECK(evapo && evapo->component("type")->code == 5,          "evapotranspiration over rice");

    r = land(codec, "55055 20150 55305");
    const auto* sunshine = r.list(Field::Sunshine);
    CHECK(sunshine && sunshine->size() == 2, "two sunshine entries");
    if (sunshine && sunshine->size() == 2) {
        const Observation& daily = (*sunshine)[0];
        CHECK(near(daily.component("amount")->value, 5.5),    "daily sunshine 5.5 h");
        CHECK(near(daily.component("duration")->value, 24),   "daily sunshine covers 24 h");
        CHECK(daily.items.size() == 1,                        "one radiation group attached");
        if (daily.items.size() == 1) {
            const Observation& item = daily.items[0];
            CHECK(item.component("type")->text == "global solar radiation", "radiation type j = 2");
            CHECK(near(item.component("amount")->value, 150),                "150 J/cm2");
            CHECK(item.component("amount")->unit == "J/cm2",                "daily radiation unit");
        }
        const Observation& hourly = (*sunshine)[1];
        CHECK(near(hourly.component("amount")->value, 0.5),  "hourly sunshine 0.5 h");
        CHECK(near(hourly.component("duration")->value, 1), "hourly sunshine covers 1 h");
    }

    r = land(codec, "55055 40100 30200");
    sunshine = r.list(Field::Sunshine);
    CHECK(sunshine && sunshine->size() == 1 && (*sunshine)[0].items.size() == 1,
          "radiation groups must increase");
    CHECK(contains(r.not_implemented, "30200"), "decreasing radiation group left over");

    r = land(codec, "55055 60123");
    sunshine = r.list(Field::Sunshine);
    CHECK(sunshine && (*sunshine)[0].items.size() == 1, "6FFFF is radiation when iR excludes group 3");

    r = codec.decode("AAXX 01004 88889 02782 61506 333 55055 60123");
    sunshine = r.list(Field::Sunshine);
    CHECK(sunshine && (*sunshine)[0].items.empty(), "6RRRt stays precipitation when iR announces it");
    CHECK(r.has(Field::PrecipitationS3),            "section 3 precipitation decoded");

    r = land(codec, "55407");
    CHECK(contains(r.not_implemented, "55407"), "554 sunshine variant not decoded");

    r = land(codec, "56357");
    const Observation* drift = r.get(Field::CloudDriftDirection);
    CHECK(drift && drift->component("low")->text == "SE" && drift->component("high")->text == "NW",
          "cloud drift directions");

    r = land(codec, "58012");
    const Observation* change = r.get(Field::PressureChange);
    CHECK(change && near(change->value, 1.2) && change->code == 8, "24 h pressure rise 1.2 hPa");
    r = land(codec, "59012");
    change = r.get(Field::PressureChange);
    CHECK(change && near(change->value, -1.2) && change->code == 9, "24 h pressure fall 1.2 hPa");

    r = land(codec, "58012 59012");
    change = r.get(Field::PressureChange);
    CHECK(change && near(change->value, 1.2),   "first 24 h pressure change kept");
    CHECK(contains(r.not_implemented, "59012"), "second 24 h pressure change not decoded");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: groups 6 to 8
// ─────────────────────────────────────────────────────────────────────────────
static void testPrecipitationAndLayers(const Codec& codec) {
    std::cout << "\n=== Test: Section 3 groups 6-8 ===\n";

    Report r = land(codec, "60012 70123 83620 83758");
    CHECK(r.warnings.size() == 1, "unannounced section 3 precipitation warned");

    const auto* precipitation = r.list(Field::PrecipitationS3);
    CHECK(precipitation && precipitation->size() == 2, "two precipitation entries");
    if (precipitation && precipitation->size() == 2) {
        CHECK(near((*precipitation)[0].component("amount")->value, 1), "6-group: 1 mm");
        const Observation& daily = (*precipitation)[1];
        CHECK(near(daily.component("amount")->value, 12.3),        "7-group: 12.3 mm");
        CHECK(near(daily.component("time_before_obs")->value, 24), "7-group covers 24 h");
    }

    const auto* layers = r.list(Field::CloudLayer);
    CHECK(layers && layers->size() == 2, "two cloud layers");
    if (layers && layers->size() == 2) {
        const Observation& first = (*layers)[0];
        CHECK(near(first.component("cloud_cover")->value, 3),   "layer 1: 3 okta");
        CHECK(first.component("cloud_genus")->text == "Sc",     "layer 1: Sc");
        CHECK(near(first.component("cloud_height")->value, 600), "layer 1: 600 m");
        CHECK((*layers)[1].component("cloud_genus")->text == "St", "layer 2: St");
        CHECK(near((*layers)[1].component("cloud_height")->value, 2400), "layer 2: 2400 m");
    }

    r = land(codec, "79999");
    precipitation = r.list(Field::PrecipitationS3);
    CHECK(precipitation && (*precipitation)[0].component("amount")->flag("trace"), "7-group trace");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: group 9 family
// ─────────────────────────────────────────────────────────────────────────────
static void testNine(const Codec& codec) {
    std::cout << "\n=== Test: Section 3 group 9 ===\n";

    Report r = land(codec, "90010 90112");
    const Observation* t = r.get(Field::WeatherTime);
    CHECK(t && near(t->value, 60) && t->table == "4077T", "900: began 60 min ago");
    t = r.get(Field::TimeOfEnding);
    CHECK(t && near(t->value, 72), "901: ended 72 min ago");

    r = land(codec, "90076");
    t = r.get(Field::WeatherTime);
    CHECK(t && t->table == "4077Z" && near(t->value, 76), "900 with tt 76 uses the tt >= 76 table");

    r = land(codec, "91099 00123 91520");
    const auto* gusts = r.list(Field::HighestGust);
    CHECK(gusts && gusts->size() == 1, "one gust");
    if (gusts && gusts->size() == 1) {
        const Observation& g = (*gusts)[0];
        CHECK(near(g.component("speed")->value, 123) && g.component("speed")->unit == "KT", "gust 123 KT");
        CHECK(near(g.component("direction")->value, 200), "gust from 200 deg");
        CHECK(near(g.component("measure_period")->value, 10), "910: 10 minute gust");
        CHECK(!g.component("time_before_obs"), "910 has no time before observation");
    }

    r = land(codec, "91125");
    gusts = r.list(Field::HighestGust);
    const Observation* period = gusts ? (*gusts)[0].component("time_before_obs") : nullptr;
    CHECK(period && near(period->value, 6) && period->unit == "h", "911 without 907: 6 h at 00 UTC");

    r = land(codec, "90710 91125 93102");
    gusts = r.list(Field::HighestGust);
    period = gusts ? (*gusts)[0].component("time_before_obs") : nullptr;
    CHECK(period && near(period->value, 60) && period->unit == "min", "907 applies to 911");
    const Observation* snow = r.get(Field::SnowFall);
    const Observation* snowPeriod = snow ? snow->component("time_before_obs") : nullptr;
    CHECK(snowPeriod && near(snowPeriod->value, 60), "907 still applies to 931");
    CHECK(snow && near(snow->component("amount")->value, 20), "fresh snow 20 mm");
    CHECK(r.not_implemented.empty(), "907 consumed");

    r = land(codec, "90710");
    CHECK(contains(r.not_implemented, "90710"), "907 without a following group not decoded");

    r = land(codec, "90710 90720 91125");
    CHECK(contains(r.not_implemented, "90710"), "superseded 907 not decoded");
    gusts = r.list(Field::HighestGust);
    period = gusts ? (*gusts)[0].component("time_before_obs") : nullptr;
    CHECK(period && near(period->value, 120), "latest 907 applies");

    r = land(codec, "92461 92721");
    const Observation* sea = r.get(Field::SeaState);
    CHECK(sea && sea->component("state")->code == 6, "sea state 6");
    const Observation* seaVis = sea ? sea->component("visibility") : nullptr;
    CHECK(seaVis && near(seaVis->min, 50) && near(seaVis->max, 200), "seaward visibility 50-200 m");
    CHECK(r.has(Field::FrozenDeposit), "frozen deposit decoded");

    r = land(codec, "93405 93792");
    const auto* deposits = r.list(Field::DepositDiameter);
    CHECK(deposits && deposits->size() == 2, "two deposits");
    if (deposits && deposits->size() == 2) {
        CHECK((*deposits)[0].component("type")->text == "glaze", "934: glaze");
        CHECK(near((*deposits)[0].component("diameter")->value, 5), "glaze 5 mm");
        CHECK((*deposits)[1].component("type")->text == "wet_snow", "937: wet snow");
        CHECK(near((*deposits)[1].component("diameter")->value, 0.2), "wet snow 0.2 mm");
    }

    r = land(codec, "98290 98082");
    const auto* vis = r.list(Field::VisibilityDirection);
    CHECK(vis && vis->size() == 2, "two directional visibilities");
    if (vis && vis->size() == 2) {
        const Observation& east = (*vis)[0];
        CHECK(east.component("direction")->text == "E", "first towards the east");
        CHECK(near(east.component("visibility")->value, 50) &&
              east.component("visibility")->quantifier == Quantifier::IsLess, "less than 50 m");
        CHECK(east.component("visibility")->flag("use90"), "90-99 band recorded");
        CHECK((*vis)[1].component("direction")->flag("towards_sea"), "98 0 means towards the sea");
        CHECK(near((*vis)[1].component("visibility")->value, 40000), "towards the sea 40 km");
    }

    r = land(codec, "98990");
    CHECK(contains(r.not_implemented, "98990"), "989 not decoded");

    r = land(codec, "99021");
    const Observation* optical = r.get(Field::OpticalPhenomena);
    CHECK(optical && optical->component("phenomenon")->text == "Solar or lunar halo", "halo");
    CHECK(optical && optical->component("intensity")->text == "Moderate",             "moderate");

    r = land(codec, "99605 99810");
    const Observation* dt = r.get(Field::SuddenTemperatureChange);
    CHECK(dt && near(dt->value, 5) && dt->unit == "Cel", "sudden rise of 5 Cel");
    const Observation* du = r.get(Field::SuddenHumidityChange);
    CHECK(du && near(du->value, 10) && du->unit == "%", "sudden humidity rise of 10 %");

    r = land(codec, "99705");
    dt = r.get(Field::SuddenTemperatureChange);
    CHECK(dt && near(dt->value, -5), "sudden fall of 5 Cel");

    r = land(codec, "91212");
    CHECK(contains(r.not_implemented, "91212"), "912 not decoded");

    r = land(codec, "90710 93112 90712 91120");
    snow = r.get(Field::SnowFall);
    snowPeriod = snow ? snow->component("time_before_obs") : nullptr;
    CHECK(snowPeriod && near(snowPeriod->value, 60),   "907 ahead of 931 applies");
    CHECK(contains(r.not_implemented, "91120"),        "911 after 931 not decoded");
    CHECK(!r.list(Field::HighestGust),                 "out of order gust dropped");
    CHECK(contains(r.not_implemented, "90712"),        "907 left without a group not decoded");

    r = land(codec, "91125 90712 93112");
    gusts = r.list(Field::HighestGust);
    snow = r.get(Field::SnowFall);
    snowPeriod = snow ? snow->component("time_before_obs") : nullptr;
    CHECK(gusts && gusts->size() == 1,                 "911 decoded");
    CHECK(snowPeriod && near(snowPeriod->value, 72),   "907 between 911 and 931 applies to 931");
    CHECK(r.not_implemented.empty(),                   "907 may follow a higher 9-group");
}

int main(int argc, char* argv[]) {
    fs::path spec_path = (argc > 1)
        ? fs::path(argv[1])
        : fs::path(__FILE__).parent_path().parent_path() / "specs" / "FM12_tables.xml";

    std::cout << "Using spec: " << spec_path << '\n';

    Codec codec;
    try {
        codec.registerCodeBook(loadSpec(spec_path));
    } catch (const std::exception& e) {
        std::cerr << "FAIL spec load: " << e.what() << '\n';
        ++failures;
    }

    if (failures == 0) {
        testRegionalAndTemperatures(codec);
        testFive(codec);
        testPrecipitationAndLayers(codec);
        testNine(codec);
    }

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}

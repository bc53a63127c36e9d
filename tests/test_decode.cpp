// test_decode.cpp – Tests for decoding SYNOP / SHIP / BUOY telegrams
// (Sections 0, 1, 2, ICE, 4 and 5 and the report state machine).
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_decode

#include "SynopCodec/Codec.hpp"
#include "SynopCodec/Errors.hpp"
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

static const Observation* part(const Report& r, Field f, const char* name) {
    const Observation* o = r.get(f);
    return o ? o->component(name) : nullptr;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: land station report with sections 0, 1 and 3
// ─────────────────────────────────────────────────────────────────────────────
static void testLandStation(const Codec& codec) {
    std::cout << "\n=== Test: Decode AAXX land station ===\n";

    const Report r = codec.decode("AAXX 01004 88889 12782 61506 10094 20047 30111 40197 "
                                  "53007 60001 70102 81541 333 10178 21073 34101");

    CHECK(r.get(Field::StationType) && r.at(Field::StationType).text == "AAXX", "station type AAXX");
    CHECK(r.get(Field::StationId) && r.at(Field::StationId).text == "88889",    "station index 88889");
    CHECK(r.get(Field::Region) && r.at(Field::Region).text == "III",            "block 88 is region III");

    const Observation* day  = part(r, Field::ObsTime, "day");
    const Observation* hour = part(r, Field::ObsTime, "hour");
    CHECK(day && near(day->value, 1) && hour && near(hour->value, 0), "observed on day 1 at 00 UTC");

    const Observation* iw = r.get(Field::WindIndicator);
    CHECK(iw && near(iw->value, 4) && iw->unit == "KT", "wind indicator 4: knots");
    CHECK(iw && !iw->flag("estimated"),                 "wind speed measured");

    const Observation* ir = r.get(Field::PrecipitationIndicator);
    CHECK(ir && ir->flag("in_group_1") && !ir->flag("in_group_3"), "iR 1: precipitation in section 1 only");

    const Observation* h = r.get(Field::LowestCloudBase);
    CHECK(h && near(h->min, 1500) && near(h->max, 2000), "lowest cloud 1500-2000 m");
    CHECK(r.get(Field::Visibility) && near(r.at(Field::Visibility).value, 40000), "visibility 40 km");
    CHECK(r.get(Field::CloudCover) && near(r.at(Field::CloudCover).value, 6),     "cloud cover 6 okta");

    const Observation* dir   = part(r, Field::SurfaceWind, "direction");
    const Observation* speed = part(r, Field::SurfaceWind, "speed");
    CHECK(dir && near(dir->value, 150),                       "wind from 150 deg");
    CHECK(speed && near(speed->value, 6) && speed->unit == "KT", "wind 6 KT");

    CHECK(near(r.at(Field::AirTemperature).value, 9.4),        "air temperature 9.4 Cel");
    CHECK(r.at(Field::AirTemperature).unit == "Cel",           "air temperature unit Cel");
    CHECK(near(r.at(Field::DewpointTemperature).value, 4.7),   "dewpoint 4.7 Cel");
    CHECK(near(r.at(Field::StationPressure).value, 1011.1),    "station pressure 1011.1 hPa");
    CHECK(near(r.at(Field::SeaLevelPressure).value, 1019.7),   "sea level pressure 1019.7 hPa");

    const Observation* tendency = part(r, Field::PressureTendency, "tendency");
    const Observation* change   = part(r, Field::PressureTendency, "change");
    CHECK(tendency && tendency->code == 3, "pressure tendency a = 3");
    CHECK(change && near(change->value, 0.7), "pressure change +0.7 hPa");

    const Observation* rrr = part(r, Field::PrecipitationS1, "amount");
    const Observation* tr  = part(r, Field::PrecipitationS1, "time_before_obs");
    CHECK(rrr && near(rrr->value, 0) && tr && near(tr->value, 6), "no precipitation in 6 h");

    const Observation* ww = r.get(Field::PresentWeather);
    CHECK(ww && ww->code == 1 && ww->table == "4677", "present weather 01 (manned)");
    const Observation* wwPeriod = ww ? ww->component("time_before_obs") : nullptr;
    CHECK(wwPeriod && near(wwPeriod->value, 6), "present weather covers 6 h at 00 UTC");
    const auto* past = r.list(Field::PastWeather);
    CHECK(past && past->size() == 2 && (*past)[0].code == 0 && (*past)[1].code == 2, "past weather 0 and 2");

    const Observation* nh = part(r, Field::CloudTypes, "low_cloud_amount");
    const Observation* cl = part(r, Field::CloudTypes, "low_cloud_type");
    CHECK(nh && near(nh->value, 1), "Nh 1 refers to the low clouds");
    CHECK(cl && near(cl->value, 5), "CL 5");

    CHECK(near(r.at(Field::MaximumTemperature).value, 17.8), "maximum temperature 17.8 Cel");
    CHECK(near(r.at(Field::MinimumTemperature).value, -7.3), "minimum temperature -7.3 Cel");
    const Observation* ground = part(r, Field::GroundState, "temperature");
    CHECK(ground && near(ground->value, -1), "ground temperature -1 Cel");

    CHECK(r.warnings.empty(),        "no warnings");
    CHECK(r.not_implemented.empty(), "every group decoded");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: buoy with section 2, an unsupported 9-group and section 5
// ─────────────────────────────────────────────────────────────────────────────
static void testBuoy(const Codec& codec) {
    std::cout << "\n=== Test: Decode BBXX buoy report ===\n";

    const Report r = codec.decode(
        "BBXX 51002 19001 99170 71577 46/// /0709 10267 20232 30132 40135 92350 "
        "22251 00268 10804 20604 310// 40802 61234 70021 80092 333 91212 "
        "555 11102 22108 8//10 92344");

    CHECK(r.get(Field::Callsign) && r.at(Field::Callsign).text == "51002", "callsign 51002");
    CHECK(r.get(Field::Region) && r.at(Field::Region).text == "V",         "buoy deployed in region V");

    const Observation* lat = part(r, Field::StationPosition, "latitude");
    const Observation* lon = part(r, Field::StationPosition, "longitude");
    CHECK(lat && near(lat->value, 17.0),   "latitude 17.0");
    CHECK(lon && near(lon->value, -157.7), "longitude -157.7 (quadrant 7)");

    const Observation* iw = r.get(Field::WindIndicator);
    CHECK(iw && iw->unit == "m/s", "wind indicator 1: m/s");
    const Observation* ix = r.get(Field::WeatherIndicator);
    CHECK(ix && ix->flag("automatic"), "ix 6: automatic station");

    const Observation* gg = part(r, Field::ExactObservationTime, "hour");
    const Observation* mm = part(r, Field::ExactObservationTime, "minute");
    CHECK(gg && near(gg->value, 23) && mm && near(mm->value, 50), "exact time 23:50");

    const Observation* ds = part(r, Field::Displacement, "direction");
    CHECK(ds && ds->text == "SW", "ship moving towards the south-west");

    const Observation* sst = r.get(Field::SeaSurfaceTemperature);
    CHECK(sst && near(sst->value, 26.8), "sea surface temperature 26.8 Cel");
    const Observation* method = sst ? sst->component("measurement_type") : nullptr;
    CHECK(method && method->text == "Intake", "sea temperature measured at intake");

    const auto* waves = r.list(Field::WindWaves);
    CHECK(waves && waves->size() == 3, "three wind wave entries");
    if (waves && waves->size() == 3) {
        const Observation& instrumental = (*waves)[0];
        CHECK(instrumental.flag("instrumental") && !instrumental.flag("accurate"), "1-group is instrumental");
        CHECK(near(instrumental.component("period")->value, 8), "instrumental period 8 s");
        CHECK(near(instrumental.component("height")->value, 2), "instrumental height 2 m");
        CHECK(!(*waves)[1].flag("instrumental"),                "2-group is estimated");
        CHECK((*waves)[2].flag("accurate"),                     "70-group is accurate");
        CHECK(near((*waves)[2].component("height")->value, 2.1), "accurate height 2.1 m");
    }

    const auto* swell = r.list(Field::SwellWaves);
    CHECK(swell && swell->size() == 1, "one swell train");
    if (swell && !swell->empty()) {
        const Observation* d = (*swell)[0].component("direction");
        CHECK(d && near(d->value, 100), "swell from 100 deg");
        CHECK(near((*swell)[0].component("height")->value, 1), "swell height 1 m");
    }

    const Observation* source = part(r, Field::IceAccretion, "source");
    const Observation* thick  = part(r, Field::IceAccretion, "thickness");
    CHECK(source && source->flag("spray") && !source->flag("fog"), "ice from spray");
    CHECK(thick && near(thick->value, 23) && thick->unit == "cm", "ice 23 cm thick");

    const Observation* wb = r.get(Field::WetBulbTemperature);
    CHECK(wb && near(wb->value, 9.2) && wb->flag("measured"), "wet bulb 9.2 Cel, measured");

    CHECK(contains(r.not_implemented, "91212"), "912 kept as not implemented");
    CHECK(!r.warnings.empty(),                  "not implemented group reported");
    CHECK(r.section5.size() == 4,               "section 5 kept verbatim");
    CHECK(r.section5.size() == 4 && r.section5[2] == "8//10", "section 5 group order kept");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: irregular report structures
// ─────────────────────────────────────────────────────────────────────────────
static void testStructure(const Codec& codec) {
    std::cout << "\n=== Test: Decode report structure ===\n";

    Report r = codec.decode("BBXX zdlp 19004 99607 50455 NIL");
    CHECK(r.get(Field::Callsign) && r.at(Field::Callsign).text == "ZDLP", "callsign upper-cased");
    CHECK(!r.has(Field::PrecipitationIndicator),                          "NIL: no section 1");
    CHECK(r.warnings.empty(),                                             "NIL report is clean");
    CHECK(r.nil,                                                          "NIL recorded");

    r = codec.decode("BBXX ZDLP 19004 99607 50455");
    CHECK(!r.nil && r.warnings.empty(), "report ending after section 0 without NIL");

    r = codec.decode("AAXX 01004 88889 12782 61506 444 12345 555 11102");
    CHECK(r.section4.size() == 1 && r.section4[0] == "12345", "section 4 kept verbatim");
    CHECK(r.section5.size() == 1 && r.section5[0] == "11102", "section 5 after section 4");

    r = codec.decode("BBXX 51002 19001 99170 71577 46/// /0709 10267 22251 00268 12204 22205");
    const auto* waves = r.list(Field::WindWaves);
    CHECK(waves && waves->size() == 2, "222 inside section 2 is a wave group");
    if (waves && waves->size() == 2) {
        const Observation& estimated = (*waves)[1];
        CHECK(!estimated.flag("instrumental"),                        "2PPHH: estimated waves");
        CHECK(near(estimated.component("period")->value, 22),         "wave period 22 s");
        CHECK(near(estimated.component("height")->value, 2.5),        "wave height 2.5 m");
    }
    CHECK(r.not_implemented.empty(), "every section 2 group decoded");

    r = codec.decode("AAXX 01004 88889 12782 61506 10094 444 22230 555 11111");
    CHECK(r.section4.size() == 1 && r.section4[0] == "22230", "222 inside section 4 kept verbatim");
    CHECK(r.section5.size() == 1 && r.section5[0] == "11111", "section 5 follows");

    r = codec.decode("AAXX 01004 88889 12782 61506 22200 04019");
    CHECK(contains(r.not_implemented, "22200") && contains(r.not_implemented, "04019"),
          "section 2 from a land station not decoded");

    r = codec.decode("AAXX 01004 88889 12782");
    CHECK(r.has(Field::Visibility),  "partial report keeps section 1 fields");
    CHECK(!r.has(Field::SurfaceWind), "truncated report has no wind");
    CHECK(!r.warnings.empty(),        "truncated report warned");

    r = codec.decode("AAXX 01004 88889 12782 61506 10094 10095");
    CHECK(contains(r.not_implemented, "10095"), "repeated section 1 header not decoded");

    bool threw = false;
    try { (void)codec.decode("CCXX 01004 88889"); } catch (const DecodeError&) { threw = true; }
    CHECK(threw, "unknown station type is fatal");

    threw = false;
    try { (void)codec.decode("AAXX 01004"); } catch (const DecodeError&) { threw = true; }
    CHECK(threw, "report ending inside section 0 is fatal");

    threw = false;
    try { (void)codec.decode("AAXX 01004 00000 12782 61506"); } catch (const DecodeError&) { threw = true; }
    CHECK(threw, "station index outside every region is fatal");

    threw = false;
    try { (void)codec.decode("AAXX 01004 88889 12782 61506 333 10178 444 12345 333 10180"); }
    catch (const DecodeError&) { threw = true; }
    CHECK(threw, "section 3 after section 4 is fatal");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: recoverable problems
// ─────────────────────────────────────────────────────────────────────────────
static void testRecoverable(Codec& codec) {
    std::cout << "\n=== Test: Decode recoverable problems ===\n";

    std::vector<std::string> seen;
    codec.setWarningHandler([&seen](std::string_view msg) { seen.emplace_back(msg); });

    Report r = codec.decode("AAXX 01004 88889 12751 61506 10094");
    CHECK(!r.has(Field::Visibility),           "invalid VV 51 omitted");
    CHECK(r.has(Field::LowestCloudBase),       "rest of the iRixhVV group kept");
    CHECK(r.has(Field::AirTemperature),        "following groups still decoded");
    CHECK(r.warnings.size() == 1,              "one warning recorded");
    CHECK(seen.size() == 1 && seen[0] == r.warnings[0], "warning handler called with the same text");
    CHECK(!r.warnings.empty() && r.warnings[0].find("51 is not a valid code") != std::string::npos,
          "warning names the bad code");

    seen.clear();
    r = codec.decode("AAXX 01004 88889 12782 60005");
    const Observation* dir   = part(r, Field::SurfaceWind, "direction");
    const Observation* speed = part(r, Field::SurfaceWind, "speed");
    CHECK(dir && dir->flag("calm"),              "calm wind direction");
    CHECK(speed && !speed->available,            "speed of a calm wind dropped");
    CHECK(seen.size() == 1,                      "calm wind with speed warned");

    r = codec.decode("AAXX 01004 88889 42782 61506 6////");
    CHECK(r.has(Field::PrecipitationS1), "unannounced 6-group still decoded");
    CHECK(r.warnings.size() == 1,        "unannounced 6-group warned");

    codec.setWarningHandler(nullptr);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 5: lookahead and context-dependent groups
// ─────────────────────────────────────────────────────────────────────────────
static void testContext(const Codec& codec) {
    std::cout << "\n=== Test: Decode context-dependent groups ===\n";

    Report r = codec.decode("AAXX 01004 88889 12782 61599 00234 10094");
    const Observation* speed = part(r, Field::SurfaceWind, "speed");
    CHECK(speed && near(speed->value, 234), "00fff extension gives 234 KT");
    CHECK(r.has(Field::AirTemperature),     "group after the extension decoded");

    r = codec.decode("AAXX 01004 88889 12782 61599 10094");
    speed = part(r, Field::SurfaceWind, "speed");
    CHECK(speed && near(speed->value, 99), "without an extension the speed stays 99");

    r = codec.decode("AAXX 01004 88889 12782 61506 70102");
    CHECK(r.get(Field::PresentWeather) && r.at(Field::PresentWeather).table == "4677", "manned: 4677");
    r = codec.decode("AAXX 01004 88889 17782 61506 70102");
    CHECK(r.get(Field::PresentWeather) && r.at(Field::PresentWeather).table == "4680", "automatic: 4680");

    r = codec.decode("AAXX 01034 88889 12782 61506 70102");
    const Observation* period = r.get(Field::PresentWeather)
                                    ? r.at(Field::PresentWeather).component("time_before_obs")
                                    : nullptr;
    CHECK(period && near(period->value, 3), "present weather covers 3 h at 03 UTC");

    DecodeOptions russian;
    russian.country = "RU";
    r = codec.decode("AAXX 01004 88889 62782 61506", russian);
    const Observation* ir = r.get(Field::PrecipitationIndicator);
    CHECK(ir && ir->flag("in_group_1") && !ir->flag("in_group_3"), "RU iR 6: section 1 only");
    r = codec.decode("AAXX 01004 88889 62782 61506");
    CHECK(!r.has(Field::PrecipitationIndicator), "iR 6 invalid outside RU");

    r = codec.decode("AAXX 01004 88889 12782 61506 48512");
    CHECK(r.get(Field::GeopotentialSurface) && near(r.at(Field::GeopotentialSurface).value, 850),
          "4a3hhh: 850 hPa surface");
    CHECK(r.get(Field::GeopotentialHeight) && near(r.at(Field::GeopotentialHeight).value, 1512),
          "850 hPa height 1512 gpm");

    r = codec.decode("AAXX 01004 88889 12782 61506 81/4/");
    const Observation* cm = part(r, Field::CloudTypes, "middle_cloud_amount");
    CHECK(cm && near(cm->value, 1), "Nh refers to middle clouds when CL is missing");

    r = codec.decode("OOXX AAATN 18214 99759 50874 56057 12501 46/// /1219");
    const Observation* square = part(r, Field::StationPosition, "marsden_square");
    const Observation* elev   = part(r, Field::StationPosition, "elevation");
    const Observation* conf   = part(r, Field::StationPosition, "confidence");
    CHECK(square && near(square->value, 560), "Marsden square 560");
    CHECK(elev && near(elev->value, 1250) && elev->unit == "m", "elevation 1250 m");
    CHECK(conf && conf->text == "Excellent", "position confidence excellent");
    CHECK(r.warnings.empty(), "Marsden square agrees with the position");

    r = codec.decode("OOXX AAATN 18214 99759 50874 56047 12501 46/// /1219");
    CHECK(r.warnings.size() == 1, "Marsden square disagreement warned");

    r = codec.decode("BBXX ZDLP 19004 99607 50455 41298 81307 ICE 12345");
    const Observation* ice = r.get(Field::SeaLandIce);
    CHECK(ice && ice->component("concentration") && near(ice->component("concentration")->value, 1),
          "coded ICE group");
    r = codec.decode("BBXX ZDLP 19004 99607 50455 41298 81307 ICE icy conditions 333 10178");
    ice = r.get(Field::SeaLandIce);
    CHECK(ice && ice->text == "icy conditions", "plain language ICE block");
    CHECK(r.has(Field::MaximumTemperature),     "section 3 after the ICE block");
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
        testLandStation(codec);
        testBuoy(codec);
        testStructure(codec);
        testRecoverable(codec);
        testContext(codec);
    }

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}

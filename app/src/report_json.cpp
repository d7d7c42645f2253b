#include "report_json.h"

#include <ArduinoJson.h>

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace Parity::App {

using DSP::BandLevel;
using DSP::ChannelReport;
using DSP::MetricResult;
using DSP::Report;
using DSP::SignalTimeline;
using DSP::Verdict;

double roundTo(double value, int decimals) noexcept {
    if (!std::isfinite(value)) return value;
    const double scale = std::pow(10.0, decimals);
    const double rounded = std::round(value * scale) / scale;
    return rounded == 0.0 ? 0.0 : rounded;
}

namespace {

// Document pool bounds; a pool that overflows is doubled up to the limit
constexpr size_t kInitialCapacity = 16 * 1024;
constexpr size_t kMaxCapacity = 64 * 1024 * 1024;

} // namespace

// =============================================================================
// Writing
// =============================================================================

namespace {

double level(double value) {
    return roundTo(value, kLevelDecimals);
}

double seconds(double value) {
    return roundTo(value, kTimeDecimals);
}

void setTextOrNull(JsonObject obj, const char* key, const std::string& text) {
    if (text.empty()) {
        obj[key] = static_cast<const char*>(nullptr);
    } else {
        obj[key] = text;
    }
}

void writeLevelTriple(JsonObject parent, const char* key, double ref, double cur, double diff) {
    JsonObject obj = parent.createNestedObject(key);
    obj["ref_db"] = level(ref);
    obj["cin_db"] = level(cur);
    obj["diff_db"] = level(diff);
}

// Summary fields shared by the global summary and every channel entry
void writeSummary(JsonObject obj, const MetricResult& m, const Verdict& v) {
    obj["overall"] = std::string(DSP::toString(v.outcome));

    JsonArray failures = obj.createNestedArray("failures");
    for (const auto p : v.predicates) {
        failures.add(std::string(DSP::toString(p)));
    }

    JsonArray failedBands = obj.createNestedArray("failed_bands");
    for (const auto& name : v.failedBands) {
        failedBands.add(name);
    }

    obj["dead_channel"] = m.deadChannel;
    obj["spec_dev95_db"] = level(m.specDev95Db);
    writeLevelTriple(obj, "rms", m.refRmsDb, m.curRmsDb, m.diffRmsDb);
    writeLevelTriple(obj, "crest", m.refCrestDb, m.curCrestDb, m.diffCrestDb);

    JsonObject diff = obj.createNestedObject("bands_diff_db");
    JsonObject ref = obj.createNestedObject("bands_ref_db");
    JsonObject cur = obj.createNestedObject("bands_cin_db");
    for (const auto& band : m.bands) {
        diff[band.name] = level(band.diffDb);
        ref[band.name] = level(band.refDb);
        cur[band.name] = level(band.curDb);
    }
}

void writeTimeline(JsonObject parent, const char* key, const SignalTimeline& timeline) {
    JsonObject obj = parent.createNestedObject(key);
    obj["count"] = timeline.count();

    JsonArray markers = obj.createNestedArray("markers_s");
    for (const double t : timeline.markersSeconds) {
        markers.add(seconds(t));
    }

    JsonArray segments = obj.createNestedArray("segments");
    for (const auto& s : timeline.segments) {
        JsonObject seg = segments.createNestedObject();
        seg["start_s"] = seconds(s.startS);
        seg["end_s"] = seconds(s.endS);
        seg["dur_s"] = seconds(s.durS);
    }
}

void writeReport(JsonObject root, const Report& report) {
    root["app"] = report.app;
    root["version"] = report.version;
    root["timestamp_utc"] = report.timestampUtc;
    root["fs_hz"] = std::lround(report.sampleRate);
    setTextOrNull(root, "reference_file", report.referenceId);
    setTextOrNull(root, "cinema_file", report.currentId);

    JsonObject beeps = root.createNestedObject("beeps");
    writeTimeline(beeps, "reference", report.reference);
    writeTimeline(beeps, "cinema", report.current);

    writeSummary(root.createNestedObject("summary"), report.metrics, report.verdict);

    JsonArray channels = root.createNestedArray("channels");
    for (const auto& channel : report.channels) {
        JsonObject entry = channels.createNestedObject();
        entry["index"] = channel.index;
        writeSummary(entry, channel.metrics, channel.verdict);
    }
    root["channels_detected"] = report.channelsDetected;
}

} // namespace

std::string serializeReport(const Report& report) {
    size_t capacity = kInitialCapacity;
    DynamicJsonDocument doc(capacity);
    writeReport(doc.to<JsonObject>(), report);
    while (doc.overflowed() && capacity < kMaxCapacity) {
        capacity *= 2;
        doc = DynamicJsonDocument(capacity);
        writeReport(doc.to<JsonObject>(), report);
    }

    std::string text;
    serializeJsonPretty(doc, text);
    // Pretty output breaks lines with CRLF; the persisted layout uses LF
    text.erase(std::remove(text.begin(), text.end(), '\r'), text.end());
    text += '\n';
    return text;
}

// =============================================================================
// Reading
// =============================================================================

namespace {

class ReportReader {
public:
    [[nodiscard]] const std::string& error() const { return error_; }

    bool readReport(JsonVariantConst document, Report& report) {
        if (!document.is<JsonObjectConst>()) return fail("report is not an object");
        const JsonObjectConst root = document.as<JsonObjectConst>();

        if (!readString(root, "app", report.app)) return false;
        if (!readString(root, "version", report.version)) return false;
        if (!readString(root, "timestamp_utc", report.timestampUtc)) return false;
        if (!readNumber(root, "fs_hz", report.sampleRate)) return false;
        if (!readOptionalString(root, "reference_file", report.referenceId)) return false;
        if (!readOptionalString(root, "cinema_file", report.currentId)) return false;

        const JsonVariantConst beeps = root["beeps"];
        if (!beeps.is<JsonObjectConst>()) return fail("missing 'beeps' object");
        if (!readTimeline(beeps.as<JsonObjectConst>(), "reference", report.reference)) return false;
        if (!readTimeline(beeps.as<JsonObjectConst>(), "cinema", report.current)) return false;

        const JsonVariantConst summary = root["summary"];
        if (!summary.is<JsonObjectConst>()) return fail("missing 'summary' object");
        if (!readSummary(summary.as<JsonObjectConst>(), report.metrics, report.verdict)) return false;

        const JsonVariantConst channels = root["channels"];
        if (!channels.is<JsonArrayConst>()) return fail("missing 'channels' array");
        report.channels.clear();
        for (const JsonVariantConst entry : channels.as<JsonArrayConst>()) {
            if (!entry.is<JsonObjectConst>()) return fail("channel entry is not an object");
            const JsonObjectConst fields = entry.as<JsonObjectConst>();

            ChannelReport channel;
            double index = 0.0;
            if (!readNumber(fields, "index", index)) return false;
            if (index < 0.0) return fail("negative channel index");
            channel.index = static_cast<size_t>(index);
            if (!readSummary(fields, channel.metrics, channel.verdict)) return false;
            report.channels.push_back(std::move(channel));
        }

        double detected = 0.0;
        if (!readNumber(root, "channels_detected", detected)) return false;
        if (detected < 0.0) return fail("negative 'channels_detected'");
        report.channelsDetected = static_cast<size_t>(detected);
        return true;
    }

private:
    bool fail(std::string message) {
        error_ = std::move(message);
        return false;
    }

    bool readString(JsonObjectConst obj, const char* key, std::string& out) {
        const JsonVariantConst v = obj[key];
        if (!v.is<const char*>()) return fail(std::string("missing string '") + key + "'");
        out = v.as<std::string>();
        return true;
    }

    bool readOptionalString(JsonObjectConst obj, const char* key, std::string& out) {
        const JsonVariantConst v = obj[key];
        if (v.isNull()) {
            out.clear();
            return true;
        }
        if (!v.is<const char*>()) return fail(std::string("'") + key + "' is not a string");
        out = v.as<std::string>();
        return true;
    }

    bool readNumber(JsonObjectConst obj, const char* key, double& out) {
        const JsonVariantConst v = obj[key];
        if (!v.is<double>()) return fail(std::string("missing number '") + key + "'");
        out = v.as<double>();
        return true;
    }

    bool readBool(JsonObjectConst obj, const char* key, bool& out) {
        const JsonVariantConst v = obj[key];
        if (!v.is<bool>()) return fail(std::string("missing boolean '") + key + "'");
        out = v.as<bool>();
        return true;
    }

    bool readLevelTriple(JsonObjectConst obj, const char* key,
                         double& ref, double& cur, double& diff) {
        const JsonVariantConst v = obj[key];
        if (!v.is<JsonObjectConst>()) return fail(std::string("missing object '") + key + "'");
        const JsonObjectConst triple = v.as<JsonObjectConst>();
        return readNumber(triple, "ref_db", ref) && readNumber(triple, "cin_db", cur)
            && readNumber(triple, "diff_db", diff);
    }

    bool readStringArray(JsonObjectConst obj, const char* key, std::vector<std::string>& out) {
        out.clear();
        if (!obj.containsKey(key)) return true;
        const JsonVariantConst v = obj[key];
        if (!v.is<JsonArrayConst>()) return fail(std::string("'") + key + "' is not an array");
        for (const JsonVariantConst item : v.as<JsonArrayConst>()) {
            if (!item.is<const char*>()) return fail(std::string("non-string entry in '") + key + "'");
            out.push_back(item.as<std::string>());
        }
        return true;
    }

    bool readSummary(JsonObjectConst obj, MetricResult& m, Verdict& v) {
        std::string overall;
        if (!readString(obj, "overall", overall)) return false;
        const auto outcome = DSP::outcomeFromString(overall);
        if (!outcome) return fail("unknown verdict '" + overall + "'");
        v.outcome = *outcome;

        std::vector<std::string> names;
        if (!readStringArray(obj, "failures", names)) return false;
        v.predicates.clear();
        for (const auto& name : names) {
            const auto predicate = DSP::predicateFromString(name);
            if (!predicate) return fail("unknown failure '" + name + "'");
            v.predicates.push_back(*predicate);
        }
        if (!readStringArray(obj, "failed_bands", v.failedBands)) return false;

        if (!readBool(obj, "dead_channel", m.deadChannel)) return false;
        if (!readNumber(obj, "spec_dev95_db", m.specDev95Db)) return false;
        if (!readLevelTriple(obj, "rms", m.refRmsDb, m.curRmsDb, m.diffRmsDb)) return false;
        if (!readLevelTriple(obj, "crest", m.refCrestDb, m.curCrestDb, m.diffCrestDb)) return false;

        const JsonVariantConst diff = obj["bands_diff_db"];
        const JsonVariantConst ref = obj["bands_ref_db"];
        const JsonVariantConst cur = obj["bands_cin_db"];
        if (!diff.is<JsonObjectConst>() || !ref.is<JsonObjectConst>() || !cur.is<JsonObjectConst>()) {
            return fail("missing band level objects");
        }

        // Band order follows the diff table
        m.bands.clear();
        for (const JsonPairConst entry : diff.as<JsonObjectConst>()) {
            BandLevel band;
            band.name = entry.key().c_str();
            if (!entry.value().is<double>()) return fail("band '" + band.name + "' is not a number");
            band.diffDb = entry.value().as<double>();
            if (!readNumber(ref.as<JsonObjectConst>(), band.name.c_str(), band.refDb)) return false;
            if (!readNumber(cur.as<JsonObjectConst>(), band.name.c_str(), band.curDb)) return false;
            m.bands.push_back(std::move(band));
        }
        return true;
    }

    bool readTimeline(JsonObjectConst beeps, const char* key, SignalTimeline& out) {
        const JsonVariantConst t = beeps[key];
        if (!t.is<JsonObjectConst>()) return fail(std::string("missing beeps '") + key + "'");
        const JsonObjectConst timeline = t.as<JsonObjectConst>();

        const JsonVariantConst markers = timeline["markers_s"];
        if (!markers.is<JsonArrayConst>()) return fail("missing 'markers_s' array");
        out.markersSeconds.clear();
        for (const JsonVariantConst marker : markers.as<JsonArrayConst>()) {
            if (!marker.is<double>()) return fail("non-numeric marker");
            out.markersSeconds.push_back(marker.as<double>());
        }

        double count = 0.0;
        if (!readNumber(timeline, "count", count)) return false;
        if (count != static_cast<double>(out.markersSeconds.size())) {
            return fail(std::string("marker count mismatch in '") + key + "'");
        }

        const JsonVariantConst segments = timeline["segments"];
        if (!segments.is<JsonArrayConst>()) return fail("missing 'segments' array");
        out.segments.clear();
        for (const JsonVariantConst seg : segments.as<JsonArrayConst>()) {
            if (!seg.is<JsonObjectConst>()) return fail("segment is not an object");
            const JsonObjectConst fields = seg.as<JsonObjectConst>();
            DSP::SegmentTimes times;
            if (!readNumber(fields, "start_s", times.startS)) return false;
            if (!readNumber(fields, "end_s", times.endS)) return false;
            if (!readNumber(fields, "dur_s", times.durS)) return false;
            out.segments.push_back(times);
        }
        return true;
    }

    std::string error_;
};

} // namespace

bool parseReport(std::string_view json, Report& out, std::string& error) {
    size_t capacity = std::max(kInitialCapacity, json.size() * 4);
    DynamicJsonDocument doc(capacity);
    DeserializationError status = deserializeJson(doc, json.data(), json.size());
    while (status == DeserializationError::NoMemory && capacity < kMaxCapacity) {
        capacity *= 2;
        doc = DynamicJsonDocument(capacity);
        status = deserializeJson(doc, json.data(), json.size());
    }
    if (status) {
        error = std::string("invalid JSON: ") + status.c_str();
        return false;
    }

    Report parsed;
    ReportReader reader;
    if (!reader.readReport(doc, parsed)) {
        error = reader.error();
        return false;
    }
    out = std::move(parsed);
    return true;
}

} // namespace Parity::App

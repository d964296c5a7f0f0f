#include "model/config.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace {
std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// stod accepts trailing garbage ("12abc"); config values must be fully numeric.
double parseDouble(const std::string& val) {
    size_t used = 0;
    double out = std::stod(val, &used);
    if (used != val.size()) {
        throw std::invalid_argument("trailing characters");
    }
    if (!std::isfinite(out)) {
        throw std::invalid_argument("not a finite number");
    }
    return out;
}

int parseInt(const std::string& val) {
    size_t used = 0;
    int out = std::stoi(val, &used);
    if (used != val.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return out;
}

// Range checks below compare with < and <=, which NaN slips through.
bool finiteFields(const Config& cfg, std::string& err) {
    const std::pair<const char*, double> scalars[] = {
        {"simulationDurationMinutes", cfg.simulationDurationMinutes},
        {"warmupMinutes", cfg.warmupMinutes},
        {"arrivalEndMinutes", cfg.arrivalEndMinutes},
        {"arrivalRatePerHour", cfg.arrivalRatePerHour},
        {"peakFactor", cfg.peakFactor},
        {"offPeakFactor", cfg.offPeakFactor},
        {"triageDelayMean", cfg.triageDelayMean},
        {"triageDelayStd", cfg.triageDelayStd},
        {"triageDelayMin", cfg.triageDelayMin},
        {"snapshotIntervalMinutes", cfg.snapshotIntervalMinutes},
        {"abandonCheckIntervalMinutes", cfg.abandonCheckIntervalMinutes},
        {"abandonPatienceMinutes", cfg.abandonPatienceMinutes},
        {"bedHoldMean", cfg.bedHoldMean},
        {"bedHoldStd", cfg.bedHoldStd},
        {"fuzzyOutputStep", cfg.fuzzyOutputStep},
    };
    for (const auto& field : scalars) {
        if (!std::isfinite(field.second)) {
            err = std::string(field.first) + " must be a finite number";
            return false;
        }
    }
    const std::pair<const char*, const CategoryTable<double>*> tables[] = {
        {"waitTarget", &cfg.waitTargetMinutes},
        {"consultMean", &cfg.consultMeanMinutes},
        {"consultStd", &cfg.consultStdMinutes},
        {"admitProb", &cfg.admitProbability},
    };
    for (const auto& table : tables) {
        for (int i = 0; i < kCategoryCount; ++i) {
            if (!std::isfinite((*table.second)[i])) {
                err = std::string(table.first) + "." + categoryName(categoryFromIndex(i)) +
                      " must be a finite number";
                return false;
            }
        }
    }
    return true;
}

// "waitTarget.RED" -> ("waitTarget", Red)
bool splitCategoryKey(const std::string& key, std::string& prefix, TriageCategory& category) {
    auto dot = key.find('.');
    if (dot == std::string::npos) return false;
    prefix = key.substr(0, dot);
    return parseCategory(key.substr(dot + 1), category);
}
} // namespace

Config defaultConfig() {
    Config cfg{};
    cfg.simulationDurationMinutes = 24 * 60;
    cfg.warmupMinutes = 2 * 60;
    cfg.arrivalEndMinutes = 0;
    cfg.randomSeed = 42;

    cfg.arrivalRatePerHour = 10.0;
    cfg.arrivalPattern = ArrivalPattern::Constant;
    cfg.peakStartHour = 8;
    cfg.peakEndHour = 20;
    cfg.peakFactor = 1.5;
    cfg.offPeakFactor = 0.5;

    cfg.triageNurses = 2;
    cfg.doctors = 4;
    cfg.cubicles = 6;
    cfg.beds = 10;

    cfg.triageDelayMean = 5.0;
    cfg.triageDelayStd = 2.0;
    cfg.triageDelayMin = 1.0;

    cfg.snapshotIntervalMinutes = 60.0;
    cfg.abandonCheckIntervalMinutes = 5.0;
    cfg.abandonPatienceMinutes = 240.0;

    cfg.bedHoldMean = 60.0;
    cfg.bedHoldStd = 20.0;

    cfg.fuzzyOutputStep = 1.0;

    cfg.waitTargetMinutes = {0.0, 10.0, 60.0, 120.0, 240.0};
    cfg.consultMeanMinutes = {45.0, 35.0, 25.0, 20.0, 15.0};
    cfg.consultStdMinutes = {15.0, 12.0, 10.0, 8.0, 5.0};
    cfg.admitProbability = {0.8, 0.4, 0.2, 0.1, 0.05};
    return cfg;
}

const char* arrivalPatternName(ArrivalPattern pattern) {
    switch (pattern) {
        case ArrivalPattern::Constant: return "constant";
        case ArrivalPattern::DayNight: return "day_night";
    }
    return "unknown";
}

bool applyConfigValue(Config& cfg, const std::string& key, const std::string& val, std::string& err) {
    try {
        if (key == "simulationDurationMinutes") cfg.simulationDurationMinutes = parseDouble(val);
        else if (key == "warmupMinutes") cfg.warmupMinutes = parseDouble(val);
        else if (key == "arrivalEndMinutes") cfg.arrivalEndMinutes = parseDouble(val);
        else if (key == "randomSeed") cfg.randomSeed = static_cast<unsigned int>(std::stoul(val));
        else if (key == "arrivalRatePerHour") cfg.arrivalRatePerHour = parseDouble(val);
        else if (key == "arrivalPattern") {
            if (val == "constant") cfg.arrivalPattern = ArrivalPattern::Constant;
            else if (val == "day_night") cfg.arrivalPattern = ArrivalPattern::DayNight;
            else {
                err = "Invalid value for key: " + key + " (expected constant or day_night)";
                return false;
            }
        }
        else if (key == "peakStartHour") cfg.peakStartHour = parseInt(val);
        else if (key == "peakEndHour") cfg.peakEndHour = parseInt(val);
        else if (key == "peakFactor") cfg.peakFactor = parseDouble(val);
        else if (key == "offPeakFactor") cfg.offPeakFactor = parseDouble(val);
        else if (key == "triageNurses") cfg.triageNurses = parseInt(val);
        else if (key == "doctors") cfg.doctors = parseInt(val);
        else if (key == "cubicles") cfg.cubicles = parseInt(val);
        else if (key == "beds") cfg.beds = parseInt(val);
        else if (key == "triageDelayMean") cfg.triageDelayMean = parseDouble(val);
        else if (key == "triageDelayStd") cfg.triageDelayStd = parseDouble(val);
        else if (key == "triageDelayMin") cfg.triageDelayMin = parseDouble(val);
        else if (key == "snapshotIntervalMinutes") cfg.snapshotIntervalMinutes = parseDouble(val);
        else if (key == "abandonCheckIntervalMinutes") cfg.abandonCheckIntervalMinutes = parseDouble(val);
        else if (key == "abandonPatienceMinutes") cfg.abandonPatienceMinutes = parseDouble(val);
        else if (key == "bedHoldMean") cfg.bedHoldMean = parseDouble(val);
        else if (key == "bedHoldStd") cfg.bedHoldStd = parseDouble(val);
        else if (key == "fuzzyOutputStep") cfg.fuzzyOutputStep = parseDouble(val);
        else if (key == "logPath") cfg.logPath = val;
        else if (key == "summaryPath") cfg.summaryPath = val;
        else {
            std::string prefix;
            TriageCategory category;
            if (!splitCategoryKey(key, prefix, category)) {
                return true;
            }
            int idx = categoryIndex(category);
            if (prefix == "waitTarget") cfg.waitTargetMinutes[idx] = parseDouble(val);
            else if (prefix == "consultMean") cfg.consultMeanMinutes[idx] = parseDouble(val);
            else if (prefix == "consultStd") cfg.consultStdMinutes[idx] = parseDouble(val);
            else if (prefix == "admitProb") cfg.admitProbability[idx] = parseDouble(val);
        }
    } catch (const std::exception&) {
        err = "Invalid value for key: " + key;
        return false;
    }
    return true;
}

bool parseConfigFile(const std::string& path, Config& cfg, std::string& err) {
    std::ifstream in(path);
    if (!in) {
        err = "Cannot open config file: " + path;
        return false;
    }
    cfg = defaultConfig();

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            err = "Line " + std::to_string(lineNo) + ": expected key=value";
            return false;
        }
        std::string key = trim(line.substr(0, pos));
        std::string val = trim(line.substr(pos + 1));
        if (!applyConfigValue(cfg, key, val, err)) {
            return false;
        }
    }
    return validateConfig(cfg, err);
}

bool validateConfig(const Config& cfg, std::string& err) {
    if (!finiteFields(cfg, err)) {
        return false;
    }
    if (cfg.simulationDurationMinutes <= 0) {
        err = "simulationDurationMinutes must be > 0";
        return false;
    }
    if (cfg.warmupMinutes < 0 || cfg.warmupMinutes >= cfg.simulationDurationMinutes) {
        err = "warmupMinutes must be >= 0 and < simulationDurationMinutes";
        return false;
    }
    if (cfg.arrivalEndMinutes < 0) {
        err = "arrivalEndMinutes must be >= 0";
        return false;
    }
    if (cfg.arrivalRatePerHour < 0) {
        err = "arrivalRatePerHour must be >= 0";
        return false;
    }
    if (cfg.peakStartHour < 0 || cfg.peakStartHour > 23 || cfg.peakEndHour < 0 || cfg.peakEndHour > 24) {
        err = "peakStartHour/peakEndHour must be within a day";
        return false;
    }
    if (cfg.peakFactor < 0 || cfg.offPeakFactor < 0) {
        err = "peakFactor/offPeakFactor must be >= 0";
        return false;
    }
    if (cfg.triageNurses <= 0 || cfg.doctors <= 0 || cfg.cubicles <= 0 || cfg.beds <= 0) {
        err = "triageNurses/doctors/cubicles/beds must be > 0";
        return false;
    }
    if (cfg.triageDelayMean <= 0 || cfg.triageDelayStd < 0 || cfg.triageDelayMin <= 0) {
        err = "triageDelayMean/triageDelayMin must be > 0 and triageDelayStd >= 0";
        return false;
    }
    if (cfg.snapshotIntervalMinutes <= 0 || cfg.abandonCheckIntervalMinutes <= 0) {
        err = "snapshotIntervalMinutes/abandonCheckIntervalMinutes must be > 0";
        return false;
    }
    if (cfg.abandonPatienceMinutes < 0) {
        err = "abandonPatienceMinutes must be >= 0";
        return false;
    }
    if (cfg.bedHoldMean <= 0 || cfg.bedHoldStd < 0) {
        err = "bedHoldMean must be > 0 and bedHoldStd >= 0";
        return false;
    }
    // Only the integer output grid keeps urgency monotonic in the symptom levels.
    if (cfg.fuzzyOutputStep != 1.0) {
        err = "fuzzyOutputStep must be 1 (output universe 1, 2, 3, 4, 5)";
        return false;
    }
    for (int i = 0; i < kCategoryCount; ++i) {
        const char* name = categoryName(categoryFromIndex(i));
        if (cfg.waitTargetMinutes[i] < 0) {
            err = std::string("waitTarget.") + name + " must be >= 0";
            return false;
        }
        if (i > 0 && cfg.waitTargetMinutes[i] <= cfg.waitTargetMinutes[i - 1]) {
            err = "wait targets must be strictly ascending from RED to BLUE";
            return false;
        }
        if (cfg.consultMeanMinutes[i] <= 0 || cfg.consultStdMinutes[i] < 0) {
            err = std::string("consultMean.") + name + " must be > 0 and consultStd >= 0";
            return false;
        }
        if (cfg.admitProbability[i] < 0 || cfg.admitProbability[i] > 1) {
            err = std::string("admitProb.") + name + " must be within [0, 1]";
            return false;
        }
    }
    return true;
}

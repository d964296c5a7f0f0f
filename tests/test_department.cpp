/**
 * @file test_department.cpp
 * @brief Test: department runs end to end (arrivals, queues, abandonment, warm-up, director).
 */

#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "department.hpp"
#include "director.hpp"
#include "model/config.hpp"
#include "roles/patient_source.hpp"
#include "util/random.hpp"

static int failures = 0;

static void check(bool ok, const char* what) {
    if (!ok) {
        printf("  FAIL: %s\n", what);
        ++failures;
    }
}

// No synthetic arrivals, no warm-up, nobody walks out, nobody is admitted.
static Config quietConfig() {
    Config cfg = defaultConfig();
    cfg.simulationDurationMinutes = 1000.0;
    cfg.warmupMinutes = 0.0;
    cfg.arrivalRatePerHour = 0.0;
    cfg.abandonPatienceMinutes = 0.0;
    cfg.triageDelayStd = 0.0;
    for (int i = 0; i < kCategoryCount; ++i) {
        cfg.admitProbability[i] = 0.0;
        cfg.consultStdMinutes[i] = 0.0;
    }
    return cfg;
}

static PatientRecord redPatient() {
    PatientRecord r;
    r.age = 30;
    r.reportedSymptoms["pain"] = "very_severe";
    return r;
}

static PatientRecord bluePatient() {
    PatientRecord r;
    r.age = 30;
    return r;
}

static std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void testIdleDepartment() {
    Config cfg = quietConfig();
    cfg.simulationDurationMinutes = 100.0;
    Department d(cfg);
    d.run();
    check(d.context().now() == 100.0, "clock ends at the horizon");
    check(d.arrivals().generated() == 0, "rate 0 generates nobody");
    check(d.metrics().arrivals() == 0, "no arrivals recorded");
    check(d.patientsInSystem() == 0, "department empty");
    SummaryPayload s = d.summary();
    check(s.totalArrivals == 0 && s.totalDepartures == 0, "empty summary counts");
    check(s.pools.size() == 4, "four pools reported");
    check(s.snapshotCount >= 1, "snapshots still taken");
}

static void testPriorityThenFifo() {
    Config cfg = quietConfig();
    cfg.triageNurses = 1;
    cfg.doctors = 1;
    cfg.cubicles = 1;
    cfg.triageDelayMean = 5.0;
    for (int i = 0; i < kCategoryCount; ++i) cfg.consultMeanMinutes[i] = 60.0;
    Department d(cfg);
    // Ids follow arrival order: 1 RED, 2 BLUE, 3 BLUE, 4 RED, 5 RED.
    d.scheduleArrival(0.0, redPatient());
    d.scheduleArrival(0.0, bluePatient());
    d.scheduleArrival(0.0, bluePatient());
    d.scheduleArrival(0.0, redPatient());
    d.scheduleArrival(0.0, redPatient());
    d.runUntil(1000.0);

    std::vector<double> starts;
    bool allSeen = true;
    for (int id : {1, 4, 5, 2, 3}) {
        const Patient* p = d.findPatient(id);
        if (p == nullptr || !p->times().consultationStart) {
            allSeen = false;
            continue;
        }
        starts.push_back(*p->times().consultationStart);
    }
    check(allSeen, "every patient consulted");
    bool ordered = starts.size() == 5;
    for (size_t i = 1; i < starts.size(); ++i) {
        if (!(starts[i - 1] < starts[i])) ordered = false;
    }
    check(ordered, "RED before BLUE, arrival order within a category");

    const Patient* first = d.findPatient(1);
    check(first != nullptr && first->verdict().category == TriageCategory::Red, "first patient is RED");
    check(first != nullptr && first->disposition() == Disposition::Discharged, "first patient discharged");
    check(d.metrics().waits(TriageCategory::Red).size() == 3, "three RED waits recorded");
    check(d.metrics().triaged()[categoryIndex(TriageCategory::Blue)] == 2, "two BLUE verdicts");
}

static void testQueuesDrain() {
    Config cfg = defaultConfig();
    cfg.simulationDurationMinutes = 3000.0;
    cfg.warmupMinutes = 0.0;
    cfg.arrivalEndMinutes = 180.0;
    cfg.arrivalRatePerHour = 12.0;
    cfg.abandonPatienceMinutes = 0.0;
    Department d(cfg);
    d.run();

    SystemSnapshot s = d.status();
    int waiting = s.statusCounts[static_cast<int>(PatientStatus::WaitingTriage)] +
                  s.statusCounts[static_cast<int>(PatientStatus::WaitingConsultation)] +
                  s.statusCounts[static_cast<int>(PatientStatus::WaitingAdmission)];
    check(d.arrivals().generated() > 0, "patients arrived");
    check(waiting == 0, "nobody left waiting");
    check(d.queues().empty(), "category queues empty");
    check(d.consultation().waitingCount() == 0, "no pending consultation requests");
    check(d.patientsInSystem() == 0, "department empty");
    check(d.doctors().held() == 0 && d.cubicles().held() == 0, "doctors and cubicles free");
    check(d.beds().held() == 0 && d.nurses().held() == 0, "beds and nurses free");
    check(static_cast<int>(d.completed().size()) == d.arrivals().generated(), "every patient completed");
    check(d.metrics().departures() == d.metrics().arrivals(), "departures match arrivals");
    check(d.metrics().leftWithoutBeingSeen() == 0, "nobody walked out");

    bool lifecycleOk = true;
    for (const auto& p : d.completed()) {
        if (!isTerminalStatus(p->status()) || !p->hasVerdict() || !p->times().departure) lifecycleOk = false;
        if (p->times().departure && *p->times().departure < p->times().arrival) lifecycleOk = false;
    }
    check(lifecycleOk, "completed patients are terminal with a verdict and departure");
}

static void testAbandonment() {
    Config cfg = quietConfig();
    cfg.simulationDurationMinutes = 2000.0;
    cfg.triageNurses = 3;
    cfg.doctors = 1;
    cfg.cubicles = 1;
    cfg.triageDelayMean = 2.0;
    cfg.abandonPatienceMinutes = 10.0;
    cfg.abandonCheckIntervalMinutes = 1.0;
    cfg.consultMeanMinutes[categoryIndex(TriageCategory::Red)] = 200.0;
    Department d(cfg);
    for (int i = 0; i < 4; ++i) d.scheduleArrival(0.0, redPatient());
    for (int i = 0; i < 3; ++i) d.scheduleArrival(0.0, bluePatient());
    d.run();

    int redDischarged = 0;
    int blueLeft = 0;
    for (const auto& p : d.completed()) {
        if (p->verdict().category == TriageCategory::Red && p->disposition() == Disposition::Discharged) {
            ++redDischarged;
        }
        if (p->verdict().category == TriageCategory::Blue &&
            p->status() == PatientStatus::LeftWithoutBeingSeen) {
            ++blueLeft;
        }
    }
    check(redDischarged == 4, "RED patients wait as long as it takes");
    check(blueLeft == 3, "BLUE patients walk out after their patience");
    check(d.metrics().leftWithoutBeingSeen() == 3, "walk-outs counted");
    check(d.metrics().waits(TriageCategory::Blue).empty(), "walk-outs have no consultation wait");
    check(!d.abandon(1), "finished patient cannot abandon");
    check(!d.abandon(999), "unknown patient cannot abandon");
}

static void testManualAbandon() {
    Config cfg = quietConfig();
    cfg.doctors = 1;
    cfg.cubicles = 1;
    for (int i = 0; i < kCategoryCount; ++i) cfg.consultMeanMinutes[i] = 100.0;
    Department d(cfg);
    d.scheduleArrival(0.0, redPatient());
    d.scheduleArrival(0.0, redPatient());
    bool signalled = false;
    d.context().scheduleAt(50.0, [&]() { signalled = d.abandon(2); });
    d.runUntil(1000.0);

    const Patient* p = d.findPatient(2);
    check(signalled, "waiting patient accepts the signal");
    check(p != nullptr && p->status() == PatientStatus::LeftWithoutBeingSeen, "signalled patient left");
    check(p != nullptr && !p->times().consultationStart, "signalled patient never consulted");
    check(d.doctors().held() == 0 && d.cubicles().held() == 0, "no units leaked");
}

static void testAbandonDuringTriage() {
    Config cfg = quietConfig();
    cfg.triageNurses = 1;
    cfg.triageDelayMean = 20.0;
    Department d(cfg);
    d.scheduleArrival(0.0, redPatient());
    d.scheduleArrival(0.0, bluePatient());
    d.scheduleArrival(0.0, bluePatient());
    d.scheduleArrival(0.0, redPatient());
    bool queuedLeft = false;
    bool heldLeft = false;
    // Patient 2 is still queued for the nurse; patient 3 holds her from 20.
    d.context().scheduleAt(5.0, [&]() { queuedLeft = d.abandon(2); });
    d.context().scheduleAt(25.0, [&]() { heldLeft = d.abandon(3); });
    d.runUntil(1000.0);

    check(queuedLeft, "patient queued for the nurse accepts the signal");
    check(heldLeft, "patient holding the nurse accepts the signal");
    const Patient* p1 = d.findPatient(1);
    const Patient* p2 = d.findPatient(2);
    const Patient* p3 = d.findPatient(3);
    const Patient* p4 = d.findPatient(4);
    check(p1 != nullptr && p1->times().triageCompleted == 20.0, "first patient triaged on time");
    check(p4 != nullptr && p4->times().triageCompleted == 45.0, "nurse passed on when the holder left");
    check(p2 != nullptr && !p2->hasVerdict() && p2->status() == PatientStatus::LeftWithoutBeingSeen,
          "queued patient left untriaged");
    check(p3 != nullptr && !p3->hasVerdict() && p3->times().departure == 25.0, "holding patient left at 25");

    bool fromTriage = p3 != nullptr && p3->statusHistory().size() >= 2;
    if (fromTriage) {
        const auto& h = p3->statusHistory();
        fromTriage = h[h.size() - 2].first == PatientStatus::WaitingTriage &&
                     h.back().first == PatientStatus::LeftWithoutBeingSeen && h.back().second == 25.0;
    }
    check(fromTriage, "walk-out recorded straight from triage wait");
    check(d.nurses().held() == 0 && d.nurses().queueLength() == 0, "nurse free at the end");
    check(d.metrics().leftWithoutBeingSeen() == 2, "triage walk-outs counted");
    check(d.metrics().triaged()[categoryIndex(TriageCategory::Blue)] == 0, "no verdict for walk-outs");
}

static void testAbandonWaitingForBed() {
    Config cfg = quietConfig();
    cfg.doctors = 2;
    cfg.cubicles = 2;
    cfg.beds = 1;
    cfg.triageDelayMean = 5.0;
    cfg.bedHoldMean = 500.0;
    cfg.bedHoldStd = 0.0;
    for (int i = 0; i < kCategoryCount; ++i) {
        cfg.admitProbability[i] = 1.0;
        cfg.consultMeanMinutes[i] = 10.0;
    }
    Department d(cfg);
    for (int i = 0; i < 3; ++i) d.scheduleArrival(0.0, redPatient());
    // Patient 1 takes the bed at 15; patients 2 and 3 queue for it.
    bool signalled = false;
    bool waitingForBed = false;
    d.context().scheduleAt(30.0, [&]() {
        const Patient* p = d.findPatient(2);
        waitingForBed = p != nullptr && p->status() == PatientStatus::WaitingAdmission;
        signalled = d.abandon(2);
    });
    d.runUntil(1000.0);

    check(waitingForBed, "second patient waits for the bed");
    check(signalled, "patient waiting for a bed accepts the signal");
    const Patient* p2 = d.findPatient(2);
    const Patient* p3 = d.findPatient(3);
    check(p2 != nullptr && p2->disposition() == Disposition::LeftWithoutBeingSeen, "bed waiter left");
    check(p2 != nullptr && p2->times().consultationEnd.has_value(), "bed waiter was seen first");
    check(p3 != nullptr && p3->disposition() == Disposition::Admitted, "next patient admitted");
    check(p3 != nullptr && p3->times().departure == 515.0, "bed passed on after the handover");
    check(d.beds().held() == 1 && d.beds().queueLength() == 0, "one bed held, nobody queued");
    check(d.metrics().leftWithoutBeingSeen() == 1, "bed walk-out counted");
    check(d.metrics().admitted() == 2, "two admissions");
}

static void testWarmupExclusion() {
    Config cfg = quietConfig();
    cfg.simulationDurationMinutes = 500.0;
    cfg.warmupMinutes = 50.0;
    Department d(cfg);
    d.scheduleArrival(10.0, bluePatient());
    d.scheduleArrival(60.0, bluePatient());
    d.run();

    int arrivedEvents = 0;
    for (const auto& e : d.metrics().events()) {
        if (e.type == EventType::PatientArrived) ++arrivedEvents;
    }
    check(arrivedEvents == 2, "both arrivals kept as raw events");
    check(d.metrics().arrivals() == 1, "warm-up arrival excluded");
    check(d.metrics().departures() == 1, "warm-up departure excluded");
    check(d.summary().totalArrivals == 1, "summary uses filtered counts");
}

static void testScriptedSource() {
    Config cfg = defaultConfig();
    cfg.simulationDurationMinutes = 600.0;
    cfg.warmupMinutes = 0.0;
    cfg.arrivalEndMinutes = 240.0;
    cfg.arrivalRatePerHour = 20.0;
    PatientRecord scripted = bluePatient();
    scripted.chiefComplaint = "scripted complaint";
    std::vector<PatientRecord> records(1, scripted);
    Department d(cfg, std::unique_ptr<PatientSource>(new ScriptedPatientSource(records)),
                 std::unique_ptr<AbandonmentPolicy>(new NeverAbandon()));
    d.run();

    bool allScripted = true;
    for (const auto& p : d.completed()) {
        if (p->chiefComplaint() != "scripted complaint") allScripted = false;
    }
    check(!d.completed().empty(), "scripted patients completed");
    check(allScripted, "every patient comes from the script");
    const CategoryTable<int>& triaged = d.metrics().triaged();
    check(triaged[categoryIndex(TriageCategory::Blue)] > 0 && triaged[categoryIndex(TriageCategory::Red)] == 0,
          "scripted BLUE population");

    bool threw = false;
    try {
        ScriptedPatientSource empty(std::vector<PatientRecord>{});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "empty script rejected");
}

static void testSyntheticSource() {
    SyntheticPatientSource source;
    RandomGenerator rng(11);
    bool ranges = true;
    int elderly = 0;
    for (int i = 0; i < 1000; ++i) {
        PatientRecord r = source.next(rng);
        if (r.age < 0 || r.age > 100 || r.chiefComplaint.empty()) ranges = false;
        if (r.gender != "male" && r.gender != "female") ranges = false;
        auto pain = r.vitals.find("pain_score");
        if (pain == r.vitals.end() || pain->second < 0 || pain->second > 10) ranges = false;
        auto spo2 = r.vitals.find("oxygen_saturation");
        if (spo2 == r.vitals.end() || spo2->second > 100.0) ranges = false;
        if (r.history.size() > 3) ranges = false;
        if (r.age >= 65) ++elderly;
    }
    check(ranges, "synthetic records stay in range");
    check(elderly > 200 && elderly < 500, "elderly share near one third");
}

static void testValidation() {
    Config cfg = defaultConfig();
    cfg.doctors = 0;
    bool threw = false;
    try {
        Department d(cfg);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "invalid configuration rejected before scheduling");

    Department ok(quietConfig());
    ok.scheduleArrival(0.0, bluePatient());
    ok.runUntil(1.0);
    threw = false;
    try {
        ok.useExternalTriage([](const Patient&) { return ExternalVerdict{"RED", 1, "0"}; });
    } catch (const std::logic_error&) {
        threw = true;
    }
    check(threw, "triage system fixed once patients arrived");
}

static void testExternalTriageRun() {
    Config cfg = quietConfig();
    Department d(cfg);
    d.useExternalTriage([](const Patient&) { return ExternalVerdict{"GREEN", 4, "2 hours"}; });
    d.scheduleArrival(0.0, redPatient());
    d.runUntil(1000.0);
    const Patient* p = d.findPatient(1);
    check(p != nullptr && p->verdict().category == TriageCategory::Green, "external verdict used");
    check(p != nullptr && p->verdict().targetWaitMinutes == 120.0, "external wait used");
}

static void testDirector() {
    const std::string logPath = "/tmp/edsim_test_director.log";
    const std::string summaryPath = "/tmp/edsim_test_director_summary.txt";
    std::remove(logPath.c_str());
    std::remove(summaryPath.c_str());

    Config cfg = defaultConfig();
    cfg.simulationDurationMinutes = 240.0;
    cfg.warmupMinutes = 0.0;
    cfg.arrivalRatePerHour = 6.0;
    cfg.logPath = logPath;
    cfg.summaryPath = summaryPath;

    Director director;
    check(director.department() == nullptr, "no department before a run");
    check(director.run(cfg) == 0, "director run succeeds");
    check(director.lastSummaryPath() == summaryPath, "summary path recorded");
    check(director.lastLogPath() == logPath, "log path recorded");
    check(slurp(summaryPath).find("ED Simulation Summary") != std::string::npos, "summary written");
    std::string log = slurp(logPath);
    check(log.find("END") != std::string::npos, "log closed with END");
    check(log.find(";q=") != std::string::npos, "log lines carry queue load");
    check(director.status().time == 240.0, "status after the run");

    Config bad = cfg;
    bad.beds = 0;
    check(director.run(bad) == 1, "invalid config fails the run");
    check(director.department() == nullptr, "no department for an invalid config");

    std::remove(logPath.c_str());
    std::remove(summaryPath.c_str());
}

int main() {
    printf("[test_department] START\n");
    testIdleDepartment();
    testPriorityThenFifo();
    testQueuesDrain();
    testAbandonment();
    testManualAbandon();
    testAbandonDuringTriage();
    testAbandonWaitingForBed();
    testWarmupExclusion();
    testScriptedSource();
    testSyntheticSource();
    testValidation();
    testExternalTriageRun();
    testDirector();
    if (failures > 0) {
        printf("[test_department] FAIL\n");
        return 1;
    }
    printf("[test_department] PASS\n");
    return 0;
}

#include "triage/flowchart.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "triage/linguistic.hpp"

const char* const kFallbackFlowchart = "unwell_adult";

std::vector<Flowchart> defaultFlowcharts() {
    return {
        // respiratory
        {"shortness_of_breath", "respiratory",
         {"difficulty_breathing", "wheeze", "unable_to_speak", "cyanosis", "exhaustion"},
         {"difficulty breathing", "shortness of breath", "breathless*", "dyspnoea", "dyspnea", "wheez*"},
         "shortness_of_breath_child"},
        {"shortness_of_breath_child", "respiratory",
         {"very_low_pefr", "exhaustion", "significant_respiratory_history", "acute_onset_after_injury", "low_sao2"},
         {}, ""},
        {"cough", "respiratory",
         {"productive_cough", "blood_in_sputum", "chest_pain", "fever", "night_sweats"},
         {"cough*", "cold symptoms", "common cold", "flu"}, ""},
        {"asthma", "respiratory",
         {"peak_flow", "wheeze", "speech_difficulty", "accessory_muscles", "cyanosis"},
         {"asthma*"}, ""},
        // cardiovascular
        {"chest_pain", "cardiovascular",
         {"severe_pain", "crushing_sensation", "radiation", "breathless", "sweating"},
         {"chest pain", "heart attack", "angina", "cardiac"}, ""},
        {"palpitations", "cardiovascular",
         {"irregular_pulse", "chest_discomfort", "dizziness", "syncope", "breathlessness"},
         {"palpitation*", "racing heart", "irregular heartbeat"}, ""},
        {"cardiac_arrest", "cardiovascular",
         {"unconscious", "no_pulse", "not_breathing", "cyanosis", "collapse"},
         {"cardiac arrest", "no pulse", "not breathing", "resuscitation"}, ""},
        {"collapse", "cardiovascular",
         {"syncope", "dizziness", "confusion", "irregular_pulse", "injury_from_fall"},
         {"collapse*", "faint*", "dizz*", "syncope", "blackout*"}, ""},
        // neurological
        {"headache", "neurological",
         {"pain_severity", "sudden_onset", "neck_stiffness", "photophobia", "confusion"},
         {"headache*", "migraine*"}, ""},
        {"confusion", "neurological",
         {"altered_consciousness", "disorientation", "agitation", "memory_loss", "speech_problems"},
         {"confus*", "disorient*", "altered mental"}, ""},
        {"fits", "neurological",
         {"active_seizure", "post_ictal", "tongue_biting", "incontinence", "injury_during_fit"},
         {"seizure*", "fit", "fits", "fitting", "convuls*", "epilep*"}, ""},
        {"stroke", "neurological",
         {"facial_droop", "arm_weakness", "speech_problems", "sudden_onset", "headache"},
         {"stroke", "facial droop", "slurred speech", "weakness one side"}, ""},
        {"unconscious_adult", "neurological",
         {"gcs_score", "response_to_pain", "pupil_reaction", "breathing_pattern", "pulse_quality"},
         {"unconscious", "unresponsive", "coma"}, ""},
        // gastrointestinal
        {"abdominal_pain", "gastrointestinal",
         {"pain_intensity", "vomiting", "rigidity", "distension", "tenderness"},
         {"abdominal pain", "stomach pain", "tummy pain", "abdomen"}, "abdominal_pain_child"},
        {"abdominal_pain_child", "gastrointestinal",
         {"pain_intensity", "vomiting", "lethargy", "distension", "fever"},
         {}, ""},
        {"vomiting", "gastrointestinal",
         {"blood_in_vomit", "dehydration", "abdominal_pain", "bile_stained", "projectile"},
         {"vomit*", "nausea*", "nauseous"}, "child_vomiting"},
        {"diarrhoea", "gastrointestinal",
         {"blood_in_stool", "dehydration", "cramping", "fever", "mucus"},
         {"diarrhoea", "diarrhea"}, ""},
        {"gi_bleeding", "gastrointestinal",
         {"haematemesis", "melaena", "shock", "pallor", "weakness"},
         {"vomiting blood", "blood in stool", "haematemesis", "hematemesis", "rectal bleeding"}, ""},
        // trauma
        {"limb_injuries", "trauma",
         {"deformity", "pain", "swelling", "loss_of_function", "bleeding"},
         {"limb*", "fracture*", "sprain*", "joint pain", "arm injury", "leg injury", "ankle*", "wrist*"}, ""},
        {"head_injury", "trauma",
         {"loss_of_consciousness", "confusion", "vomiting", "headache", "amnesia"},
         {"head injury", "head trauma", "concussion"}, ""},
        {"neck_injury", "trauma",
         {"neck_pain", "neurological_deficit", "mechanism_of_injury", "tenderness", "deformity"},
         {"neck injury", "neck pain", "whiplash"}, ""},
        {"back_injury", "trauma",
         {"back_pain", "leg_weakness", "numbness", "bladder_problems", "mechanism"},
         {"back injury", "back pain", "spine", "spinal"}, ""},
        {"burns", "trauma",
         {"burn_area", "depth", "airway_involvement", "pain", "blistering"},
         {"burn", "burns", "burned", "burnt", "scald*"}, ""},
        {"wounds", "trauma",
         {"bleeding", "depth", "contamination", "pain", "location"},
         {"wound*", "laceration*", "cut", "cuts"}, ""},
        {"falls", "trauma",
         {"pain", "loss_of_function", "confusion", "deformity", "long_lie"},
         {"fall", "falls", "fallen", "fell"}, ""},
        {"major_trauma", "trauma",
         {"shock", "airway_compromise", "loss_of_consciousness", "bleeding", "mechanism_of_injury"},
         {"major trauma", "road traffic", "car accident", "motorcycle", "polytrauma"}, ""},
        {"torso_injury", "trauma",
         {"pain", "breathless", "shock", "bruising", "mechanism_of_injury"},
         {"torso", "rib", "ribs", "chest injury"}, ""},
        {"assault", "trauma",
         {"bleeding", "loss_of_consciousness", "pain", "deformity", "risk_to_self"},
         {"assault*", "stab", "stabbed", "stabbing", "gunshot*", "punched"}, ""},
        {"facial_problems", "trauma",
         {"swelling", "pain", "airway_compromise", "vision_loss", "bleeding"},
         {"facial", "face", "jaw"}, ""},
        {"dental_problems", "ent",
         {"pain", "swelling", "bleeding", "fever", "difficulty_swallowing"},
         {"dental", "tooth", "teeth", "toothache"}, ""},
        {"bites_and_stings", "trauma",
         {"swelling", "breathing_difficulty", "pain", "rash", "shock"},
         {"bite", "bites", "bitten", "sting", "stings", "stung"}, ""},
        {"foreign_body", "trauma",
         {"airway_compromise", "pain", "bleeding", "breathing_difficulty", "difficulty_swallowing"},
         {"foreign body", "swallowed", "object in"}, ""},
        {"chemical_exposure", "trauma",
         {"burn_area", "breathing_difficulty", "eye_involvement", "pain", "confusion"},
         {"chemical*", "inhal*", "gas exposure"}, ""},
        // genitourinary and obstetric
        {"urinary_problems", "genitourinary",
         {"dysuria", "frequency", "urgency", "haematuria", "retention"},
         {"urinary", "urine", "urinat*", "dysuria", "bladder"}, ""},
        {"renal_colic", "genitourinary",
         {"loin_pain", "haematuria", "nausea", "restlessness", "radiation"},
         {"renal colic", "kidney stone", "loin pain", "flank pain"}, ""},
        {"testicular_pain", "genitourinary",
         {"pain", "swelling", "sudden_onset", "nausea", "fever"},
         {"testic*", "scrot*"}, ""},
        {"pregnancy_problems", "obstetric",
         {"bleeding", "pain", "contractions", "fetal_movements", "blood_pressure"},
         {"pregnan*", "labour", "labor", "contractions"}, ""},
        {"vaginal_bleeding", "obstetric",
         {"amount", "pain", "pregnancy_test", "clots", "shock"},
         {"vaginal bleeding", "pv bleed"}, ""},
        // paediatric
        {"crying_baby", "paediatric",
         {"inconsolable", "fever", "feeding_problems", "rash", "lethargy"},
         {"crying baby", "inconsolable"}, ""},
        {"child_fever", "paediatric",
         {"temperature", "rash", "neck_stiffness", "lethargy", "feeding"},
         {}, ""},
        {"child_vomiting", "paediatric",
         {"dehydration", "bile_stained", "blood", "lethargy", "abdominal_pain"},
         {}, ""},
        {"irritable_child", "paediatric",
         {"inconsolable", "fever", "lethargy", "rash", "dehydration"},
         {"irritable child", "irritable"}, ""},
        {"limping_child", "paediatric",
         {"pain", "fever", "swelling", "loss_of_function", "deformity"},
         {"limping", "limp"}, ""},
        {"worried_parent", "paediatric",
         {"lethargy", "feeding", "fever", "rash", "breathing_difficulty"},
         {"worried parent", "parent concerned"}, ""},
        {"unwell_child", "paediatric",
         {"temperature", "lethargy", "rash", "breathing_difficulty", "dehydration"},
         {}, ""},
        // psychiatric
        {"mental_illness", "psychiatric",
         {"risk_to_self", "risk_to_others", "psychosis", "depression", "agitation"},
         {"mental", "anxiety", "anxious", "panic*", "depress*", "psychosis", "psychotic", "hallucinat*"}, ""},
        {"self_harm", "psychiatric",
         {"risk_to_self", "bleeding", "consciousness_level", "agitation", "depression"},
         {"self harm", "suicid*"}, ""},
        {"overdose_poisoning", "psychiatric",
         {"consciousness_level", "respiratory_depression", "cardiac_effects", "seizures", "antidote_available"},
         {"overdose*", "poison*", "ingestion"}, ""},
        {"apparently_drunk", "psychiatric",
         {"consciousness_level", "injury", "vomiting", "agitation", "respiratory_depression"},
         {"drunk", "intoxicat*", "alcohol*"}, ""},
        {"behaving_strangely", "psychiatric",
         {"agitation", "confusion", "risk_to_others", "psychosis", "temperature"},
         {"behaving strangely", "strange behaviour", "bizarre"}, ""},
        // other
        {"rash", "dermatological",
         {"distribution", "fever", "itch", "blistering", "systemic_illness"},
         {"rash*", "skin", "hives"}, ""},
        {"eye_problems", "ophthalmological",
         {"pain", "vision_loss", "discharge", "photophobia", "injury"},
         {"eye", "eyes", "vision"}, ""},
        {"ear_problems", "ent",
         {"pain", "discharge", "hearing_loss", "dizziness", "fever"},
         {"ear", "ears", "earache", "hearing"}, ""},
        {"sore_throat", "ent",
         {"pain", "difficulty_swallowing", "fever", "drooling", "stridor"},
         {"sore throat", "throat", "tonsil*"}, ""},
        {"diabetes", "endocrine",
         {"blood_glucose", "ketones", "dehydration", "consciousness", "breathing"},
         {"diabet*", "hypoglyc*", "hyperglyc*", "blood sugar"}, ""},
        {"allergy", "allergic",
         {"rash", "swelling", "breathing_difficulty", "shock", "tongue_swelling"},
         {"allerg*", "anaphyla*"}, ""},
        {"fever", "general",
         {"temperature", "rigors", "rash", "confusion", "breathing_difficulty"},
         {"fever", "high temperature", "pyrexia", "rigors"}, "child_fever"},
        {"unwell_adult", "general",
         {"temperature", "pain", "breathing_difficulty", "confusion", "shock"},
         {"unwell", "weakness", "lethargy", "lethargic", "general malaise"}, "unwell_child"},
    };
}

namespace {
std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

// Lower-case alphanumeric words; anything else separates words.
std::vector<std::string> words(const std::string& text) {
    std::vector<std::string> out;
    std::string current;
    for (unsigned char ch : text) {
        if (std::isalnum(ch)) {
            current.push_back(static_cast<char>(std::tolower(ch)));
        } else if (!current.empty()) {
            out.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        out.push_back(current);
    }
    return out;
}

bool isStem(const std::string& keyword) {
    return !keyword.empty() && keyword.back() == '*';
}

size_t keywordLength(const std::string& keyword) {
    return isStem(keyword) ? keyword.size() - 1 : keyword.size();
}

// Whole-word phrase match; a stem keyword's last word only has to prefix a complaint word.
bool containsPhrase(const std::vector<std::string>& text, const std::string& keyword) {
    bool stem = isStem(keyword);
    std::vector<std::string> phrase = words(keyword.substr(0, keywordLength(keyword)));
    if (phrase.empty() || phrase.size() > text.size()) {
        return false;
    }
    for (size_t start = 0; start + phrase.size() <= text.size(); ++start) {
        bool match = true;
        for (size_t i = 0; i < phrase.size() && match; ++i) {
            const std::string& word = text[start + i];
            if (stem && i + 1 == phrase.size()) {
                match = word.compare(0, phrase[i].size(), phrase[i]) == 0;
            } else {
                match = word == phrase[i];
            }
        }
        if (match) {
            return true;
        }
    }
    return false;
}
} // namespace

FlowchartSelector::FlowchartSelector()
    : FlowchartSelector(defaultFlowcharts(), kFallbackFlowchart) {}

FlowchartSelector::FlowchartSelector(std::vector<Flowchart> table, const std::string& fallback)
    : table_(std::move(table)), fallbackIndex_(0) {
    bool found = false;
    for (size_t i = 0; i < table_.size(); ++i) {
        if (table_[i].symptoms.size() > static_cast<size_t>(kSymptomInputs)) {
            throw std::invalid_argument("flowchart '" + table_[i].name + "' lists more than " +
                                        std::to_string(kSymptomInputs) + " symptoms");
        }
        for (auto& kw : table_[i].keywords) {
            kw = toLower(kw);
        }
        if (table_[i].name == fallback) {
            fallbackIndex_ = i;
            found = true;
        }
    }
    if (!found) {
        throw std::invalid_argument("fallback flowchart '" + fallback + "' is not in the table");
    }
}

const Flowchart* FlowchartSelector::find(const std::string& name) const {
    for (const auto& f : table_) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

const Flowchart& FlowchartSelector::select(const std::string& complaint, int age) const {
    std::vector<std::string> text = words(complaint);
    const Flowchart* best = &fallback();
    size_t bestLen = 0;
    for (const auto& f : table_) {
        for (const auto& kw : f.keywords) {
            size_t len = keywordLength(kw);
            if (len > bestLen && containsPhrase(text, kw)) {
                best = &f;
                bestLen = len;
            }
        }
    }
    if (age >= 0 && age < 16 && !best->childVariant.empty()) {
        if (const Flowchart* child = find(best->childVariant)) {
            return *child;
        }
    }
    return *best;
}

#include "category_profile.hpp"

namespace {

const KeywordList kEmptyList;

CategoryProfile heartwarming_profile() {
    CategoryProfile p;
    p.id = "heartwarming";
    p.display_name = "Heartwarming Content";

    p.content_types = {
        {"reunions", {"reunion", "reunited", "reuniting", "coming home", "homecoming", "finally together"}},
        {"surprises", {"surprise", "surprised", "proposal", "unexpected gift"}},
        {"acts_of_kindness", {"kindness", "helping", "donated", "stranger", "good deed", "paying it forward"}},
        {"family_moments", {"family", "grandma", "grandpa", "first steps", "newborn"}},
        {"animal_rescue", {"rescue", "adopted", "shelter", "puppy", "kitten"}}
    };

    p.viewer_emotions.strong = {"sobbing", "bawling", "ugly crying", "tears of joy", "broke down"};
    p.viewer_emotions.moderate = {"cry", "tears", "emotional", "touching", "moved me", "goosebumps", "chills"};
    p.viewer_emotions.mild = {"sweet", "wholesome", "beautiful", "heartwarming", "precious", "adorable", "smile"};

    p.authenticity_signals.genuine = {"genuine", "real emotion", "spontaneous", "candid", "authentic", "real reaction"};
    p.authenticity_signals.staged = {"fake", "staged", "scripted", "acting", "set up", "for views", "clout"};

    p.speech_patterns = {
        {"gratitude", {"thank you", "grateful", "i love you", "means so much"}},
        {"surprise_reaction", {"oh my god", "no way", "i can't believe", "what are you doing here"}},
        {"reassurance", {"it's okay", "i'm here", "i missed you", "welcome home"}}
    };

    p.context_phrases = {"made me", "the part where", "the moment", "when he", "when she", "when they",
                         "this part", "got me", "right at"};

    p.component_weights = {
        {"authenticity", 0.30},
        {"emotional_impact", 0.25},
        {"content_match", 0.15},
        {"viewer_response", 0.15},
        {"visual_warmth", 0.08},
        {"speech_patterns", 0.07}
    };
    p.base_score = 2.0;
    p.scale_factor = 8.0;
    p.gating = {"authenticity", 0.4, 0.6};
    p.moment_bonus = {5.0, 2, 0.8};
    p.confidence = {0.3, 10, 0.25, 0.15, 1000, 0.15, 0.3, 0.1, 10000, 0.05};
    p.labels = {"authentic", "questionable", "likely_staged"};
    p.staged_penalty_cap = 0.4;
    p.emotional_polarity = Sentiment::Positive;
    return p;
}

CategoryProfile motivational_profile() {
    CategoryProfile p;
    p.id = "motivational";
    p.display_name = "Motivational Content";

    p.content_types = {
        {"transformation", {"transformation", "before and after", "glow up", "weight loss", "changed my life"}},
        {"achievement", {"success", "achievement", "graduated", "champion", "finish line", "goal"}},
        {"comeback", {"comeback", "overcame", "overcome", "came back", "never gave up"}},
        {"mindset", {"motivation", "discipline", "mindset", "inspiring", "believe in yourself"}}
    };

    p.viewer_emotions.strong = {"life changing", "changed my life", "chills", "goosebumps", "cried"};
    p.viewer_emotions.moderate = {"inspired", "motivated", "inspiring", "determined", "pumped"};
    p.viewer_emotions.mild = {"respect", "proud", "amazing", "powerful", "love this"};

    p.authenticity_signals.genuine = {"struggle", "journey", "earned", "dedication", "years of", "hard work", "sacrifice"};
    p.authenticity_signals.staged = {"overnight success", "easy money", "secret", "hack", "get rich",
                                     "guaranteed", "passive income"};

    p.speech_patterns = {
        {"call_to_action", {"you can do", "never give up", "keep going", "start today"}},
        {"testimony", {"i used to", "i remember when", "i failed", "i was told"}},
        {"conviction", {"i believe", "i promise", "no excuses"}}
    };

    p.extra_signals = {
        {"struggle", {"struggle", "failed", "rejected", "homeless", "injury", "lost everything",
                      "rock bottom", "depression"}},
        {"achievement", {"made it", "success", "achieved", "graduated", "record", "promoted", "finished"}}
    };

    p.context_phrases = {"this part", "the moment", "when he", "when she", "the speech", "the part where",
                         "right at", "got me"};

    p.component_weights = {
        {"achievement_authenticity", 0.25},
        {"content_match", 0.20},
        {"emotional_impact", 0.20},
        {"narrative_arc", 0.15},
        {"viewer_response", 0.10},
        {"speech_patterns", 0.10}
    };
    p.base_score = 2.0;
    p.scale_factor = 8.0;
    p.gating = {"achievement_authenticity", 0.3, 0.5};
    p.moment_bonus = {5.0, 2, 1.0};
    p.confidence = {0.3, 15, 0.25, 0.15, 1000, 0.15, 0.3, 0.1, 10000, 0.05};
    p.labels = {"authentic", "questionable", "likely_fake"};
    p.staged_penalty_cap = 0.5;
    p.emotional_polarity = Sentiment::Positive;
    return p;
}

CategoryProfile traumatic_profile() {
    CategoryProfile p;
    p.id = "traumatic";
    p.display_name = "Traumatic Events";

    p.content_types = {
        {"natural_disaster", {"earthquake", "hurricane", "flood", "wildfire", "tornado", "tsunami"}},
        {"accident", {"accident", "crash", "collision", "explosion", "collapse"}},
        {"emergency_response", {"firefighters", "paramedics", "emergency", "first responders", "evacuation"}},
        {"crisis", {"crisis", "tragedy", "disaster", "breaking news", "victims"}}
    };

    p.viewer_emotions.strong = {"devastating", "horrifying", "heartbreaking", "traumatizing", "can't stop shaking"};
    p.viewer_emotions.moderate = {"shocked", "tragic", "terrifying", "scary", "heart goes out"};
    p.viewer_emotions.mild = {"prayers", "sad", "rip", "stay safe", "condolences"};

    p.authenticity_signals.genuine = {"breaking news", "official", "witness", "survivor", "eyewitness", "confirmed"};
    p.authenticity_signals.staged = {"clickbait", "sensational", "dramatic music", "fake", "staged", "reupload"};

    p.speech_patterns = {
        {"factual_reporting", {"according to", "officials said", "confirmed", "reported"}},
        {"witness_account", {"i saw", "we heard", "i was there"}},
        {"safety_guidance", {"stay safe", "evacuate", "call 911", "seek shelter"}}
    };

    p.extra_signals = {
        {"framing", {"awareness", "education", "prevention"}},
        {"responsible", {"resources", "support", "helpline", "donate", "relief", "safety"}},
        {"exploitative", {"shocking", "graphic", "insane", "you won't believe", "must watch", "gone wrong",
                          "brutal", "caught on camera"}},
        {"credibility", {"news", "official", "journalism", "reporting", "broadcast", "press"}}
    };

    p.context_phrases = {"the moment", "this part", "when the", "right at", "you can see", "watch at"};

    p.component_weights = {
        {"responsible_handling", 0.30},
        {"authenticity", 0.20},
        {"content_match", 0.15},
        {"source_credibility", 0.15},
        {"emotional_impact", 0.10},
        {"viewer_response", 0.10}
    };
    p.base_score = 1.0;
    p.scale_factor = 9.0;
    p.gating = {"responsible_handling", 0.5, 0.4};
    p.moment_bonus = {5.0, 2, 0.8};
    p.confidence = {0.2, 30, 0.25, 0.15, 1000, 0.15, 0.3, 0.1, 10000, 0.1};
    p.labels = {"responsible", "questionable", "exploitative"};
    p.staged_penalty_cap = 0.3;
    p.emotional_polarity = Sentiment::Negative;
    return p;
}

} // namespace

const KeywordList& CategoryProfile::signal_set(const std::string& name) const {
    auto it = extra_signals.find(name);
    return it == extra_signals.end() ? kEmptyList : it->second;
}

KeywordList CategoryProfile::all_content_keywords() const {
    KeywordList out;
    for (const auto& entry : content_types) {
        out.insert(out.end(), entry.second.begin(), entry.second.end());
    }
    return out;
}

KeywordList CategoryProfile::all_emotion_keywords() const {
    KeywordList out = viewer_emotions.strong;
    out.insert(out.end(), viewer_emotions.moderate.begin(), viewer_emotions.moderate.end());
    out.insert(out.end(), viewer_emotions.mild.begin(), viewer_emotions.mild.end());
    return out;
}

std::vector<CategoryProfile> default_profiles() {
    return {heartwarming_profile(), motivational_profile(), traumatic_profile()};
}

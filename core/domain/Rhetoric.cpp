#include "Rhetoric.hpp"

namespace senate::domain {

std::vector<std::string> reactionLines(ReactionType type, const std::string& speakerName) {
    switch (type) {
        case ReactionType::Agreement:
            return {"Nods in agreement with " + speakerName,
                    "Gestures supportively toward " + speakerName,
                    "Quietly says 'Bene dictum' (well said)"};
        case ReactionType::Disagreement:
            return {"Frowns at " + speakerName + "'s points",
                    "Shakes head in disagreement",
                    "Mutters quietly in disagreement"};
        case ReactionType::Interest:
            return {"Leans forward with interest",
                    "Listens attentively to " + speakerName,
                    "Takes mental notes on " + speakerName + "'s arguments"};
        case ReactionType::Boredom:
            return {"Stifles a yawn",
                    "Looks disinterested",
                    "Glances around the chamber"};
        case ReactionType::Skepticism:
            return {"Raises an eyebrow skeptically",
                    "Looks unconvinced by " + speakerName + "'s arguments",
                    "Exchanges skeptical glances with nearby senators"};
        case ReactionType::Neutral:
            break;
    }
    return {"Maintains a neutral expression",
            "Listens without visible reaction",
            "Considers the arguments carefully"};
}

std::vector<std::string> latinInterjections(InterjectionType type) {
    switch (type) {
        case InterjectionType::Support:
            return {"Assentior!", "Bene dictum!", "Recte dicis!"};
        case InterjectionType::Challenge:
            return {"Nego!", "Falsum est!", "Ubi probatio?"};
        case InterjectionType::Procedural:
            return {"Ad ordinem!", "Tempus exhaustum est!", "Non recte procedit!"};
        case InterjectionType::Emotional:
            return {"Infandum!", "Absurdum!", "Quomodo audes!"};
        case InterjectionType::Informational:
            return {"Si licet addere...", "Senator praetermisit...", "Rem gravem explicabo."};
    }
    return {"Interrumpo!"};
}

std::vector<std::string> englishInterjections(InterjectionType type, const std::string& speakerName) {
    switch (type) {
        case InterjectionType::Support:
            return {"I strongly support " + speakerName + "'s position!",
                    "Hear, hear!",
                    "Well said, colleague!"};
        case InterjectionType::Challenge:
            return {"I must challenge " + speakerName + "'s assertion!",
                    "That claim is unfounded!",
                    "Where is your evidence for this?"};
        case InterjectionType::Procedural:
            return {"Point of order!",
                    "The speaker is out of time!",
                    "This matter is not properly before the Senate!"};
        case InterjectionType::Emotional:
            return {"Outrageous!",
                    "Absurd!",
                    "How dare you suggest such a thing!"};
        case InterjectionType::Informational:
            return {"If I may add a relevant fact...",
                    "The senator has overlooked an important detail.",
                    "Let me clarify an important point."};
    }
    return {"I interject!"};
}

} // namespace senate::domain

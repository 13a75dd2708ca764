#include "nlp/intent.hpp"

std::string toString(EntityLabel label) {
    switch (label) {
        case EntityLabel::Date:  return "DATE";
        case EntityLabel::Time:  return "TIME";
        case EntityLabel::Money: return "MONEY";
        case EntityLabel::Other: return "OTHER";
    }
    return "OTHER";
}

EntityLabel entityLabelFromString(const std::string& name) {
    if (name == "DATE")  return EntityLabel::Date;
    if (name == "TIME")  return EntityLabel::Time;
    if (name == "MONEY") return EntityLabel::Money;
    return EntityLabel::Other;
}

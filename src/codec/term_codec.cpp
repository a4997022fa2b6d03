/*
 * @FileName   : term_codec.cpp
 * @CreateAt   : 2026/9/15
 * @Description: implement `TermCodec`
 */

#include "codec/term_codec.hpp"

#include <cmath>
#include <regex>
#include <limits>
#include <vector>
#include <cstdlib>
#include <unordered_set>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace quint {

const std::string TermCodec::SEP = std::string(1, '\0');
const std::string TermCodec::MAX_CHAR = "\xEF\xBF\xBF";

namespace {

const std::string XSD = "http://www.w3.org/2001/XMLSchema#";

const std::unordered_set<std::string> NUMERIC_TYPES {
    XSD + "integer",
    XSD + "decimal",
    XSD + "float",
    XSD + "double",
    XSD + "nonPositiveInteger",
    XSD + "negativeInteger",
    XSD + "long",
    XSD + "int",
    XSD + "short",
    XSD + "byte",
    XSD + "nonNegativeInteger",
    XSD + "unsignedLong",
    XSD + "unsignedInt",
    XSD + "unsignedShort",
    XSD + "unsignedByte",
    XSD + "positiveInteger",
};

// YYYY-MM-DDThh:mm:ss[.fff][Z|(+|-)hh:mm]
const std::regex DATE_TIME_PATTERN(
        R"(^\s*(-?\d{4,})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2})(\.\d+)?(Z|[+-]\d{2}:\d{2})?\s*$)");

std::string fpJoin(int encoding_case, int exponent, double mantissa) {
    return fmt::format("{}{:03d}{:.17f}", encoding_case, exponent, mantissa);
}

const std::string FPSTRING_NEG_INF = fpJoin(0, 0, 0);
const std::string FPSTRING_ZERO = fpJoin(3, 0, 0);
const std::string FPSTRING_POS_INF = fpJoin(6, 0, 0);
const std::string FPSTRING_NAN = fpJoin(7, 0, 0);

std::vector<std::string> split(const std::string &str, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (size_t pos = str.find(sep); pos != std::string::npos; pos = str.find(sep, start)) {
        parts.emplace_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    parts.emplace_back(str.substr(start));
    return parts;
}

bool startsWith(const std::string &str, const std::string &prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

Term decodeLiteral(const std::string &id) {
    size_t close = id.rfind('"');
    if (close == 0 || close == std::string::npos) {
        spdlog::warn("undecodable literal '{}', read back as IRI", id);
        return Term::namedNode(id);
    }
    std::string lexical = id.substr(1, close - 1);
    std::string suffix = id.substr(close + 1);
    if (suffix.empty()) {
        return Term::literal(lexical);
    }
    if (suffix[0] == '@') {
        return Term::langLiteral(lexical, suffix.substr(1));
    }
    if (startsWith(suffix, "^^")) {
        std::string datatype = suffix.substr(2);
        if (datatype.size() >= 2 && datatype.front() == '<' && datatype.back() == '>') {
            datatype = datatype.substr(1, datatype.size() - 2);
        }
        return Term::typedLiteral(lexical, datatype);
    }
    spdlog::warn("undecodable literal suffix in '{}', read back as IRI", id);
    return Term::namedNode(id);
}

} // namespace

std::string TermCodec::fpEncode(double mantissa) {
    if (std::isnan(mantissa)) return FPSTRING_NAN;
    if (std::isinf(mantissa)) return mantissa < 0 ? FPSTRING_NEG_INF : FPSTRING_POS_INF;
    if (mantissa == 0) return FPSTRING_ZERO;

    int exponent = 0;
    bool negative = false;

    if (mantissa < 0) {
        negative = true;
        mantissa *= -1;
    }

    while (mantissa >= 10) {
        mantissa /= 10;
        exponent += 1;
    }
    while (mantissa < 1) {
        mantissa *= 10;
        exponent -= 1;
    }

    // negative mantissas are complemented so that a larger magnitude sorts first
    if (negative) {
        if (exponent >= 0) {
            return fpJoin(1, 999 - exponent, 10 - mantissa);
        }
        return fpJoin(2, -exponent, 10 - mantissa);
    }
    if (exponent < 0) {
        return fpJoin(4, 999 + exponent, mantissa);
    }
    return fpJoin(5, exponent, mantissa);
}

std::string TermCodec::fpEncode(const std::string &lexical) {
    const char *begin = lexical.c_str();
    char *end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin) {
        return FPSTRING_NAN;
    }
    return fpEncode(value);
}

bool TermCodec::isNumericDatatype(const std::string &datatype) {
    return NUMERIC_TYPES.count(datatype) > 0;
}

double TermCodec::dateTimeToEpochMillis(const std::string &lexical) {
    std::smatch match;
    if (!std::regex_match(lexical, match, DATE_TIME_PATTERN)) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    int hour = 0, minute = 0, second = 0;
    long days = 0;
    // out of range years (too long for an int, or outside the gregorian calendar) read as NaN
    try {
        int year = std::stoi(match.str(1));
        int month = std::stoi(match.str(2));
        int day = std::stoi(match.str(3));
        hour = std::stoi(match.str(4));
        minute = std::stoi(match.str(5));
        second = std::stoi(match.str(6));
        // the year is narrowed to unsigned short below
        if (year < 1400 || year > 9999 || month < 1 || month > 12 || day < 1 || day > 31
            || hour > 24 || minute > 59 || second > 60) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        boost::gregorian::date date(static_cast<unsigned short>(year),
                                    static_cast<unsigned short>(month),
                                    static_cast<unsigned short>(day));
        days = (date - boost::gregorian::date(1970, 1, 1)).days();
    } catch (const std::out_of_range &) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    double millis = static_cast<double>(days) * 86400000.0
                  + (hour * 3600.0 + minute * 60.0 + second) * 1000.0;

    if (match[7].matched) {
        // ".123456" -> 123.456 ms, truncated to whole milliseconds
        double fraction = std::strtod(match.str(7).c_str(), nullptr);
        millis += std::floor(fraction * 1000.0);
    }

    if (match[8].matched && match.str(8) != "Z") {
        std::string zone = match.str(8);
        int offset_minutes = std::stoi(zone.substr(1, 2)) * 60 + std::stoi(zone.substr(4, 2));
        if (zone[0] == '+') {
            millis -= offset_minutes * 60000.0;
        } else {
            millis += offset_minutes * 60000.0;
        }
    }
    return millis;
}

std::string TermCodec::encodeTerm(const Term &term) {
    switch (term.type()) {
        case NAMED_NODE:
            return term.value();
        case BLANK_NODE:
            return "_:" + term.value();
        case VARIABLE:
            return "?" + term.value();
        case DEFAULT_GRAPH:
            return "";
        case LITERAL: {
            std::string id = "\"" + term.value() + "\"";
            if (!term.language().empty()) {
                id += "@" + term.language();
            } else if (!term.datatype().empty()) {
                id += "^^<" + term.datatype() + ">";
            }
            return id;
        }
    }
    return term.value();
}

Term TermCodec::decodeTerm(const std::string &id) {
    if (id.empty()) {
        return Term::defaultGraph();
    }
    switch (id[0]) {
        case '"':
            return decodeLiteral(id);
        case '?':
            return Term::variable(id.substr(1));
        case '_':
            if (startsWith(id, "_:")) {
                return Term::blankNode(id.substr(2));
            }
            break;
        default:
            break;
    }
    return Term::namedNode(id);
}

std::string TermCodec::encodeObject(const Term &term) {
    if (!term.isLiteral()) {
        return encodeTerm(term);
    }

    if (isNumericDatatype(term.datatype())) {
        return "N" + SEP + fpEncode(term.value()) + SEP + term.datatype() + SEP + term.value();
    }
    if (term.datatype() == xsd::DATE_TIME) {
        return "D" + SEP + fpEncode(dateTimeToEpochMillis(term.value())) + SEP + term.value();
    }
    return encodeTerm(term);
}

Term TermCodec::decodeObject(const std::string &id) {
    if (startsWith(id, "N" + SEP)) {
        auto parts = split(id, '\0');
        if (parts.size() < 4) {
            spdlog::warn("corrupt numeric object key, read back as IRI");
            return Term::namedNode(id);
        }
        return Term::typedLiteral(parts[3], parts[2]);
    }
    if (startsWith(id, "D" + SEP)) {
        auto parts = split(id, '\0');
        if (parts.size() < 3) {
            spdlog::warn("corrupt dateTime object key, read back as IRI");
            return Term::namedNode(id);
        }
        return Term::typedLiteral(parts[2], xsd::DATE_TIME);
    }
    return decodeTerm(id);
}

bool TermCodec::sortablePrefix(const Term &literal, std::string &prefix) {
    if (!literal.isLiteral()) {
        return false;
    }
    if (isNumericDatatype(literal.datatype())) {
        prefix = "N" + SEP + fpEncode(literal.value());
        return true;
    }
    if (literal.datatype() == xsd::DATE_TIME) {
        prefix = "D" + SEP + fpEncode(dateTimeToEpochMillis(literal.value()));
        return true;
    }
    return false;
}

std::string TermCodec::numericPrefix(double value) {
    return "N" + SEP + fpEncode(value);
}

} // namespace quint

/*
 * @FileName   : term_codec.hpp
 * @CreateAt   : 2026/9/15
 * @Description: Reversible mapping between RDF terms and the strings stored in the quints table.
 *               Subjects, predicates and graphs use the canonical textual form
 *               (IRI as-is, `_:label`, `"lexical"[@lang|^^<datatype>]`, empty string for the
 *               default graph). Objects additionally use a sortable form for numeric and
 *               dateTime literals, so that comparing stored strings byte by byte follows
 *               numeric / chronological order:
 *                   N\0<fpstring>\0<datatype>\0<lexical>
 *                   D\0<fpstring of epoch millis>\0<lexical>
 *               The fpstring only drives ordering, decoding always uses the trailing fields.
 */

#ifndef QUINT_TERM_CODEC_HPP
#define QUINT_TERM_CODEC_HPP

#include <string>

#include "common/type.hpp"

namespace quint {

class TermCodec {
public:
    /* field separator inside sortable object keys */
    static const std::string SEP;
    /* U+FFFF in UTF-8, sorts after every character legal in IRIs and literals */
    static const std::string MAX_CHAR;

    /* subject / predicate / graph encoding */
    static std::string encodeTerm(const Term &term);
    static Term decodeTerm(const std::string &id);

    /* object encoding, numeric and dateTime literals become sortable keys */
    static std::string encodeObject(const Term &term);
    static Term decodeObject(const std::string &id);

    /*
     * The ordering prefix of a numeric or dateTime literal (`N\0<fp>` / `D\0<fp>`),
     * every stored key of an equal value starts with it. Returns false for other terms.
     */
    static bool sortablePrefix(const Term &literal, std::string &prefix);
    static std::string numericPrefix(double value);

    /* sortable floating point string, 23 characters for every value */
    static std::string fpEncode(double value);
    static std::string fpEncode(const std::string &lexical);

    static bool isNumericDatatype(const std::string &datatype);

    /* xsd:dateTime lexical form to milliseconds since the epoch, NaN when malformed */
    static double dateTimeToEpochMillis(const std::string &lexical);
};

} // namespace quint

#endif //QUINT_TERM_CODEC_HPP

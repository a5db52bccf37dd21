#pragma once

#include "core/Pojo.hpp"
#include <boost/property_tree/ptree.hpp>
#include <optional>
#include <string>

namespace marshal::formats::xml {

using boost::property_tree::ptree;

/**
 * Escape text content: markup characters as entities, control characters
 * and literal "_x" as _xHHHH_
 */
std::string escapeText(const std::string& text);

/**
 * Escape an attribute value written between single quotes
 */
std::string escapeAttribute(const std::string& text);

/**
 * Reverse the _xHHHH_ encoding of escapeText (entities are decoded by the reader)
 */
std::string decodeText(const std::string& text);

/**
 * Encode a map key as an element name. Characters that are not valid in
 * XML names become _xHHHH_; a null key is "_x0000_" and "" is "_x_".
 */
std::string encodeName(const Pojo& key);

/**
 * Reverse encodeName
 */
Pojo decodeName(const std::string& name);

/**
 * Read a document with Boost.PropertyTree
 * Throws ParseError on malformed XML
 */
ptree readDocument(const std::string& input);

/**
 * Attribute value of an element, std::nullopt if absent
 */
std::optional<std::string> attribute(const ptree& element, const std::string& name);

/**
 * Whether the child name is an element (not attributes or comments)
 */
bool isElement(const std::string& childName);

bool hasChildElements(const ptree& element);

/**
 * The only top-level element of a document
 * Throws ParseError if there is none or several
 */
const ptree::value_type& rootElement(const ptree& document);

/**
 * Integer when the text has no fraction or exponent, else double
 * Throws ParseError for non-numeric text
 */
Pojo parseNumber(const std::string& text);

/**
 * Scalar text form (numbers, booleans and strings)
 */
std::string scalarText(const Pojo& value);

} // namespace marshal::formats::xml

#ifndef DUPLEX_HTTP_ACCEPT_ENCODING_H
#define DUPLEX_HTTP_ACCEPT_ENCODING_H

#include <string>
#include <vector>

#include "duplex/core/compat.h"

namespace duplex {
namespace http {

struct AcceptedCoding {
  std::string coding;  // lower-cased, "*" for the wildcard
  double quality{1.0};
};

/**
 * Parse an Accept-Encoding header value, e.g. "gzip;q=0.8, deflate, *;q=0".
 * Entries with an unparseable or out of range weight are skipped.
 */
std::vector<AcceptedCoding> parseAcceptEncoding(const std::string& header);

/**
 * Pick the coding to use from |available|, listed in server preference
 * order. A coding not named by the client takes the weight of "*" when
 * present. The highest non-zero weight wins; ties go to the earlier entry of
 * |available|. Returns nullopt for an empty header or when nothing is
 * acceptable.
 */
optional<std::string> selectEncoding(const std::string& header,
                                     const std::vector<std::string>& available);

}  // namespace http
}  // namespace duplex

#endif  // DUPLEX_HTTP_ACCEPT_ENCODING_H

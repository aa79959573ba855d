#pragma once

#include <boost/url/url.hpp>
#include <string>

namespace confwire::binding::coercions {

// Absolute URI (scheme required), RFC 3986
boost::urls::url parse_uri(const std::string& raw);

}  // namespace confwire::binding::coercions

#include "confwire/binding/uri_coercion.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/url/parse.hpp>

namespace confwire::binding::coercions {

boost::urls::url parse_uri(const std::string& raw) {
    const std::string text = boost::algorithm::trim_copy(raw);
    // value() throws boost::system::system_error on a malformed URI
    return boost::urls::url(boost::urls::parse_uri(text).value());
}

}  // namespace confwire::binding::coercions

#include "NoopResourceHandler.hpp"

namespace MdResource {

ReadResult NoopResourceHandler::ReadResource(const Url& url) const {
    return ResourceError::Unsupported("Reading from resource " + url.ToString() + " is not supported");
}

}

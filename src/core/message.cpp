#include "wirecall/core/message.hpp"

namespace wirecall {

OutboundRequest::OutboundRequest(std::string method, std::string uri)
    : method_(to_upper_ascii(method))
    , uri_(std::move(uri))
{}

InboundResponse::InboundResponse(
    int status,
    std::string reason,
    HeaderMap headers,
    std::unique_ptr<EntityStream> entity
)
    : status_(status)
    , reason_(std::move(reason))
    , headers_(std::move(headers))
    , entity_(std::move(entity))
{
    if (entity_ == nullptr) {
        entity_ = std::make_unique<BufferedEntityStream>();
        buffered_ = true;
    }
}

InboundResponse::~InboundResponse() {
    close();
}

TransportResult<void> InboundResponse::buffer_entity() {
    if (buffered_) {
        return {};
    }
    auto bytes = entity_->read_all();
    entity_->close();
    if (!bytes) {
        return tl::unexpected(bytes.error());
    }
    entity_ = std::make_unique<BufferedEntityStream>(std::move(*bytes));
    buffered_ = true;
    return {};
}

TransportResult<std::string> InboundResponse::read_text() {
    return entity_->read_all();
}

void InboundResponse::close() {
    entity_->close();
}

}  // namespace wirecall

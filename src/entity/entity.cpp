#include "wirecall/entity/entity.hpp"

namespace wirecall {

Entity Entity::bytes(std::string data, std::string content_type) {
    Entity entity;
    entity.length_ = data.size();
    entity.data_ = std::move(data);
    entity.content_type_ = std::move(content_type);
    return entity;
}

Entity Entity::text(std::string data, std::string content_type) {
    return bytes(std::move(data), std::move(content_type));
}

Entity Entity::json(Json document) {
    return streaming(
        [document = std::move(document)](EntitySink& sink) {
            sink.write(document.dump());
        },
        "application/json"
    );
}

Entity Entity::streaming(
    EntityWriter writer,
    std::string content_type,
    std::optional<std::size_t> length
) {
    Entity entity;
    entity.writer_ = std::move(writer);
    entity.content_type_ = std::move(content_type);
    entity.length_ = length;
    return entity;
}

void Entity::write_to(EntitySink& sink) const {
    if (writer_) {
        writer_(sink);
        return;
    }
    if (!data_.empty()) {
        sink.write(data_);
    }
}

}  // namespace wirecall

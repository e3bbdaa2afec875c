#include "store/types.hpp"
#include <stdexcept>

namespace mediavault {
namespace store {

const char* to_string(Variant variant) {
  switch (variant) {
    case Variant::Origin:     return "origin";
    case Variant::Exhibition: return "exhibition";
    case Variant::Thumbnail:  return "thumbnail";
    default:                  return "unknown";
  }
}

std::optional<Variant> variant_from_string(const std::string& name) {
  if (name == "origin") return Variant::Origin;
  if (name == "exhibition") return Variant::Exhibition;
  if (name == "thumbnail") return Variant::Thumbnail;
  return std::nullopt;
}

bool Entry::has_tag(const std::string& tag) const {
  if (tags.count(tag) > 0) {
    return true;
  }
  for (const auto& image : images) {
    if (image.tags.count(tag) > 0) {
      return true;
    }
  }
  return false;
}


//==============================================
// JSON CONVERSION
//==============================================

namespace {

Json::Value tags_to_json(const std::set<std::string>& tags) {
  Json::Value array(Json::arrayValue);
  for (const auto& tag : tags) {
    array.append(tag);
  }
  return array;
}

std::set<std::string> tags_from_json(const Json::Value& value) {
  if (!value.isArray()) {
    throw std::invalid_argument("tags must be an array");
  }
  std::set<std::string> tags;
  for (const auto& tag : value) {
    tags.insert(tag.asString());
  }
  return tags;
}

} // namespace

Json::Value to_json(const Entry& entry) {
  Json::Value value(Json::objectValue);
  value["id"] = static_cast<Json::Int64>(entry.id);
  value["title"] = entry.title;
  value["created_at"] = static_cast<Json::Int64>(entry.created_at);
  value["favorite"] = entry.favorite;
  value["tags"] = tags_to_json(entry.tags);

  Json::Value images(Json::arrayValue);
  for (const auto& image : entry.images) {
    Json::Value item(Json::objectValue);
    item["id"] = static_cast<Json::Int64>(image.id);
    item["tags"] = tags_to_json(image.tags);
    images.append(item);
  }
  value["images"] = images;

  Json::Value attributes(Json::objectValue);
  for (const auto& [key, attribute] : entry.attributes) {
    attributes[key] = attribute;
  }
  value["attributes"] = attributes;
  return value;
}

Entry entry_from_json(const Json::Value& value) {
  if (!value.isObject() || !value.isMember("id")) {
    throw std::invalid_argument("entry must be an object with an id");
  }

  Entry entry;
  entry.id = value["id"].asInt64();
  entry.title = value.get("title", "").asString();
  entry.created_at = value.get("created_at", Json::Value(Json::Int64(0))).asInt64();
  entry.favorite = value.get("favorite", false).asBool();
  entry.tags = tags_from_json(value.get("tags", Json::Value(Json::arrayValue)));

  for (const auto& item : value.get("images", Json::Value(Json::arrayValue))) {
    SubItem image;
    image.id = item["id"].asInt64();
    image.tags = tags_from_json(item.get("tags", Json::Value(Json::arrayValue)));
    entry.images.push_back(std::move(image));
  }

  const Json::Value& attributes = value["attributes"];
  if (attributes.isObject()) {
    for (const auto& key : attributes.getMemberNames()) {
      entry.attributes[key] = attributes[key].asString();
    }
  }
  return entry;
}

Json::Value to_json(const BlockRecord& record) {
  Json::Value value(Json::objectValue);
  Json::Value blocks(Json::arrayValue);
  for (auto block : record.blocks) {
    blocks.append(static_cast<Json::UInt64>(block));
  }
  value["blocks"] = blocks;
  value["size"] = static_cast<Json::UInt64>(record.size);
  return value;
}

BlockRecord block_record_from_json(const Json::Value& value) {
  if (!value.isObject() || !value["blocks"].isArray()) {
    throw std::invalid_argument("block record must hold a block array");
  }
  BlockRecord record;
  for (const auto& block : value["blocks"]) {
    record.blocks.push_back(block.asUInt64());
  }
  record.size = value["size"].asUInt64();
  return record;
}

} // namespace store
} // namespace mediavault

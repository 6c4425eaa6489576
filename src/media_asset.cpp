#include "core/media_asset.hpp"
#include "core/upload_errors.hpp"

std::string toString(MediaKind kind)
{
    switch (kind)
    {
    case MediaKind::IMAGE:
        return "image";
    case MediaKind::VIDEO:
        return "video";
    default:
        return "unknown";
    }
}

std::string toString(Destination destination)
{
    switch (destination)
    {
    case Destination::TWITTER:
        return "Twitter";
    case Destination::BLUESKY:
        return "Bluesky";
    default:
        return "unknown";
    }
}

nlohmann::json BlueskyBlob::toJson() const
{
    return nlohmann::json{
        {"$type", "blob"},
        {"ref", {{"$link", link}}},
        {"mimeType", mime_type},
        {"size", size}};
}

BlueskyBlob BlueskyBlob::fromJson(const nlohmann::json &blob)
{
    if (!blob.is_object() || !blob.contains("ref") || !blob["ref"].is_object() ||
        !blob["ref"].contains("$link") || !blob["ref"]["$link"].is_string())
    {
        throw ProtocolError("Blob descriptor without a string ref.$link: " + blob.dump());
    }
    if (blob.contains("mimeType") && !blob["mimeType"].is_string())
    {
        throw ProtocolError("Blob descriptor with a non-string mimeType: " + blob.dump());
    }
    if (blob.contains("size") &&
        !(blob["size"].is_number_unsigned() || (blob["size"].is_number_integer() && blob["size"].get<int64_t>() >= 0)))
    {
        throw ProtocolError("Blob descriptor with an invalid size: " + blob.dump());
    }

    BlueskyBlob result;
    result.link = blob["ref"]["$link"].get<std::string>();
    result.mime_type = blob.value("mimeType", std::string());
    result.size = blob.value("size", static_cast<uint64_t>(0));
    return result;
}

#ifndef WZB_MESSAGE_METADATA_HPP
#define WZB_MESSAGE_METADATA_HPP

#include <string>

#include "../common/canonical_json.hpp"

constexpr const char* FIELD_MESG_ID = "mesgId";
constexpr const char* FIELD_MESG_DATE = "mesgDate";
constexpr const char* FIELD_MESG_TIME = "mesgTime";

struct MessageMetadata {
    std::string mesg_id;    // 32 hex chars, unique per message
    std::string mesg_date;  // YYYYMMDD
    std::string mesg_time;  // HHMMSSmmm
};

// Clock + id source for the per-message fields some endpoints require.
class MetadataSource {
public:
    virtual ~MetadataSource() = default;
    virtual MessageMetadata next() = 0;
};

// Local wall clock and 16 random bytes from OpenSSL's DRBG.
class ClockMetadataSource : public MetadataSource {
public:
    MessageMetadata next() override;
};

// Appends mesgId/mesgDate/mesgTime to the body for any of them the caller left out.
// Returns the number of fields added.
int inject_metadata(FieldMap& body, const MessageMetadata& metadata);

#endif // WZB_MESSAGE_METADATA_HPP

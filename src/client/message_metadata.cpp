#include "client/message_metadata.hpp"
#include <openssl/rand.h>
#include <array>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

MessageMetadata ClockMetadataSource::next() {
    std::array<uint8_t, 16> id_bytes{};
    if (RAND_bytes(id_bytes.data(), static_cast<int>(id_bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }

    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm local_tm{};
    localtime_r(&in_time_t, &local_tm);

    MessageMetadata metadata;
    std::stringstream id;
    id << std::hex << std::setfill('0');
    for (uint8_t byte : id_bytes) {
        id << std::setw(2) << static_cast<int>(byte);
    }
    metadata.mesg_id = id.str();

    std::stringstream date;
    date << std::put_time(&local_tm, "%Y%m%d");
    metadata.mesg_date = date.str();

    std::stringstream time;
    time << std::put_time(&local_tm, "%H%M%S") << std::setw(3) << std::setfill('0') << millis;
    metadata.mesg_time = time.str();
    return metadata;
}

int inject_metadata(FieldMap& body, const MessageMetadata& metadata) {
    int added = 0;
    auto add = [&](const char* key, const std::string& value) {
        if (!body.contains(key)) {
            body[key] = value;
            ++added;
        }
    };
    add(FIELD_MESG_ID, metadata.mesg_id);
    add(FIELD_MESG_DATE, metadata.mesg_date);
    add(FIELD_MESG_TIME, metadata.mesg_time);
    return added;
}

// Decoding a value that may come in one of two shapes
// Compile: g++ -std=c++23 -I../include either_usage.cpp -o either_usage -pthread

#include <JsonFork/decoder.hpp>
#include <JsonFork/either.hpp>
#include <JsonFork/error_formatting.hpp>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace JsonFork;

// Older clients send a list of ids, newer ones a map of named ids.
struct LegacyPayload {
    std::vector<int> ids;
};

struct NamedPayload {
    std::map<std::string, int> ids;
};

struct Message {
    std::string sender;
    Either<LegacyPayload, NamedPayload> payload;
};

int main() {
    const char* inputs[] = {
        R"({"sender": "old", "payload": {"ids": [1, 2, 3]}})",
        R"({"sender": "new", "payload": {"ids": {"first": 1, "second": 2}}})",
        R"({"sender": "bad", "payload": {"ids": "nope"}})",
    };

    for (const char* json : inputs) {
        Message msg;
        auto result = Unmarshal(msg, std::string_view(json));
        if (!result) {
            std::cout << "Decode error: " << DecodeResultToString(result) << std::endl;
            continue;
        }
        std::cout << msg.sender << ": ";
        if (msg.payload.is_left()) {
            std::cout << msg.payload.left().ids.size() << " legacy ids" << std::endl;
        } else {
            std::cout << msg.payload.right().ids.size() << " named ids" << std::endl;
        }
    }

    std::string out;
    Message reply{"server", Either<LegacyPayload, NamedPayload>::Right(NamedPayload{{{"ack", 1}}})};
    if (auto res = Marshal(reply, out); !res) {
        std::cout << "Encode error: " << EncodeResultToString(res) << std::endl;
        return 1;
    }
    std::cout << out << std::endl;
    return 0;
}

// Reading back-to-back JSON values (e.g. JSON Lines) from stdin
// Compile: g++ -std=c++20 -I../include stream_values.cpp -o stream_values
// Usage:   printf '{"id": 1}\n{"id": 2}\n' | ./stream_values

#include <JsonDescent/error_formatting.hpp>
#include <JsonDescent/stream_deserializer.hpp>
#include <iostream>
#include <optional>
#include <string>

using namespace JsonDescent;

struct Event {
    std::uint64_t id;
    std::optional<std::string> kind;
};

int main() {
    auto events = IterateValues<Event>(std::cin);
    Event e;
    std::size_t count = 0;
    for (;;) {
        switch (events.next(e)) {
        case NextStatus::ok:
            ++count;
            std::cout << "event " << e.id << " (" << e.kind.value_or("untyped") << ") ends at byte "
                      << events.byte_offset() << std::endl;
            break;
        case NextStatus::error:
            std::cerr << "error: " << ErrorToString(events.error()) << std::endl;
            break;
        case NextStatus::end:
            std::cout << count << " events" << std::endl;
            return events.error().code() == ErrorCode::NO_ERROR ? 0 : 1;
        }
    }
}

#include "msgpk/codable.hpp"
#include "msgpk/msgpk_easy.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <tuple>
#include <vector>


namespace demo {

struct Sensor {
    std::string name;
    std::uint16_t channel = 0;
    std::vector<double> samples;
    std::optional<std::string> unit;
    msgpk::Timestamp taken;
};

inline auto fields(const Sensor& s) {
    return std::make_tuple(msgpk::field("name", s.name), msgpk::field("channel", s.channel),
                           msgpk::field("samples", s.samples), msgpk::field("unit", s.unit),
                           msgpk::field("taken", s.taken));
}

inline auto fields(Sensor& s) {
    return std::make_tuple(msgpk::field("name", s.name), msgpk::field("channel", s.channel),
                           msgpk::field("samples", s.samples), msgpk::field("unit", s.unit),
                           msgpk::field("taken", s.taken));
}

} // namespace demo

int main() {
    try {
        using namespace msgpk;

        // Loose value tree
        Value config = easy::map_of({
            {"compact", Value::make_bool(true)},
            {"schema", Value::make_uint(0)},
            {"tags", easy::array_of({easy::str("alpha"), easy::str("beta")})},
            {"blob", Value::make_binary(easy::from_hex("de ad be ef"))},
        });
        std::cout << "config packs to " << easy::to_hex(pack(config), true) << "\n";

        // Structured record through the bridge
        demo::Sensor s;
        s.name = "thermo";
        s.channel = 3;
        s.samples = {20.5, 20.75, 21.0};
        s.unit = "C";
        s.taken = Timestamp::from_time_point(std::chrono::system_clock::now());

        // Write
        WriteOptions wo;
        wo.zlib = true;
        wo.zlib_level = 6;

        std::string file = "demo_out.msgpack.z";
        write_file(file, {config, to_value(s)}, wo);

        std::cout << "Wrote: " << file << "\n";

        // Read back
        ReadOptions ro;
        ro.zlib = true;
        std::vector<Value> back = read_file(file, ro);
        std::cout << "Read " << back.size() << " values\n";

        if (back.size() == 2) {
            const Value* tags = back[0].find(std::string("tags"));
            if (tags) {
                std::cout << "Read config: tags=" << tags->count()
                          << " compact=" << (back[0].find(std::string("compact"))->bool_value() ? "true" : "false")
                          << "\n";
            }

            demo::Sensor r = from_value<demo::Sensor>(back[1]);
            std::cout << "Read sensor: name=" << r.name
                      << " channel=" << r.channel
                      << " samples=" << r.samples.size()
                      << " unit=" << r.unit.value_or("-")
                      << "\n";
        }

        std::cout << "OK\n";
        return 0;

    } catch (const msgpk::MsgpkError& e) {
        std::cerr << "msgpk error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

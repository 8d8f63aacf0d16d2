#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <cstdint>
#include <pktstack.hpp>

using namespace pktstack;

// Helper function to print a decode or build result
void printResult(const CodecResult<LayerPtr>& result, const std::string& label) {
    std::cout << label << ":\n";
    if (!result.has_value()) {
        std::cout << "  error: " << result.error().describe() << "\n\n";
        return;
    }
    std::cout << (*result)->to_string();
    std::cout << "  bytes: " << detail::to_hex_string((*result)->to_bytes()) << "\n\n";
}

int main() {
    std::cout << "pktstack Decode Examples\n";
    std::cout << "========================\n\n";

    register_builtin_decoders();

    // Example 1: ND Redirected Header option embedding a bare IPv6 header
    std::cout << "1. Decoding a Redirected Header Option\n";
    std::cout << "--------------------------------------\n";

    std::vector<uint8_t> option{0x04, 0x06, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    std::vector<uint8_t> ipv6(40, 0);
    ipv6[0] = 0x60; // version 6
    ipv6[6] = ip_number_no_next_header;
    ipv6[7] = 64;   // hop limit
    option.insert(option.end(), ipv6.begin(), ipv6.end());

    printResult(decode(Contract::ndp_option_type, ndp_option_type_redirected_header, option),
                "Redirected Header option");

    // Corrupt the embedded packet's version: the option still decodes
    option[8] = 0x40;
    printResult(decode(Contract::ndp_option_type, ndp_option_type_redirected_header, option),
                "Option with corrupt embedded packet");

    // Example 2: SSH binary packet
    std::cout << "2. Decoding an SSH Binary Packet\n";
    std::cout << "--------------------------------\n";

    const std::vector<uint8_t> ssh{0x00, 0x00, 0x00, 0x0d, 0x06,       // lengths
                                   0x05, 0x00, 0x00, 0x00, 0x01, 'x',   // payload
                                   0x00, 0x00, 0x00, 0x00, 0x00, 0x00}; // padding
    printResult(Ssh2BinaryPacket::decode(ssh), "SSH binary packet");

    const std::vector<uint8_t> empty_payload{0x00, 0x00, 0x00, 0x06, 0x05, 0, 0, 0, 0, 0};
    printResult(Ssh2BinaryPacket::decode(empty_payload), "SSH packet with no payload");

    // Example 3: Building with length correction
    std::cout << "3. Building with Length Correction\n";
    std::cout << "----------------------------------\n";

    const std::vector<uint8_t> message{0x15};
    Ssh2BinaryPacket::Builder builder;
    builder.payload_builder(std::make_unique<RawLayer::Builder>(message))
        .padding_at_build(true)
        .cipher_block_size(16)
        .correct_length_at_build(true);
    printResult(builder.build(), "Built SSH packet");

    NdpRedirectedHeaderOption::Builder option_builder;
    auto ip_builder = std::make_unique<Ipv6Packet::Builder>();
    ip_builder->hop_limit(255).correct_length_at_build(true);
    option_builder.ip_packet_builder(std::move(ip_builder)).correct_length_at_build(true);
    printResult(option_builder.build(), "Built Redirected Header option");

    return 0;
}

#include <iomanip>
#include <iostream>
#include <span>
#include <string>

#include <cstdint>
#include <padio/padio_io.hpp>

using namespace padio;

namespace {

void printCoarse(const CoarseTimestamp& ts, const std::string& label) {
    std::cout << "  " << label << ": ";
    if (ts.is_null()) {
        std::cout << "(none)\n";
        return;
    }
    std::cout << std::setfill('0') << std::setw(2) << ts.hour << ":" << std::setw(2) << ts.minute
              << " +" << std::setw(3) << ts.millisec << "ms" << std::setfill(' ') << "\n";
}

void printHeader(const CaptureHeader& h) {
    std::cout << "Capture header (" << h.encoded_size << " bytes)\n";
    std::cout << "  Module type: " << h.module_type << "\n";
    std::cout << "  Port ID: " << h.port_id << "\n";
    std::cout << "  Direction: " << h.rx_or_tx << "\n";
    std::cout << "  Description: " << h.description << "\n";
    std::cout << "  Format code: " << h.format_code << "\n";
    std::cout << "  Numbers: " << h.numbers0.first << ", " << h.numbers0.second << "\n";
    std::cout << "  Records: " << h.first_record_number << " - " << h.last_record_number
              << " (trigger " << h.trigger_record_number << ")\n";
    std::cout << "  Record length: " << h.record_len << ", timestamp array size "
              << h.timestamp_array_size << "\n";
    std::cout << "  First timestamp: " << format_seconds(h.timestamps_ns.first) << "s\n";
    std::cout << "  Last timestamp: " << format_seconds(h.timestamps_ns.last) << "s\n";
    std::cout << "  Stop timestamp: " << format_seconds(h.timestamps_ns.stop) << "s\n";
    std::cout << "  Trigger timestamp: " << format_seconds(h.timestamps_ns.trigger) << "s\n";
    std::cout << "  GUID: " << h.guid << "\n";
    std::cout << "  Channels: " << h.channel_names.a << " / " << h.channel_names.b << "\n";
    printCoarse(h.start_time, "Start time");
    printCoarse(h.stop_time, "Stop time");
    std::cout << "  Records offset: " << h.records_offset << "\n";
    std::cout << "  Record data offset: " << h.record_data_offset << "\n";
    std::cout << "  Start marker: " << h.start << "\n";
    std::cout << std::endl;
}

void printHex(std::span<const uint8_t> data) {
    std::cout << std::hex << std::setfill('0');
    for (uint8_t b : data) {
        std::cout << std::setw(2) << static_cast<unsigned>(b);
    }
    std::cout << std::dec << std::setfill(' ');
}

} // namespace

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <pad_file>\n";
        return 2;
    }

    auto reader = CaptureFileReader::open(argv[1]);
    if (!reader) {
        std::cerr << "Error opening file " << argv[1] << ": "
                  << utils::error_message(reader.error()) << "\n";
        return 1;
    }

    printHeader(reader->header());

    bool first = true;
    uint64_t prev_timestamp_ns = 0;

    while (true) {
        auto record = reader->read_next_record();
        if (!record) {
            if (utils::is_eof(record.error())) {
                break;
            }
            std::cerr << "Error reading record " << reader->records().next_record_number() << ": "
                      << utils::error_message(record.error()) << "\n";
            return 1;
        }

        auto data = reader->read_payload_without_metadata(*record);
        if (!data) {
            std::cerr << "Error reading data for record " << record->number << ": "
                      << utils::error_message(data.error()) << "\n";
            return 1;
        }

        if (first) {
            prev_timestamp_ns = record->timestamp_ns;
            first = false;
        }
        const uint64_t delta =
            record->timestamp_ns > prev_timestamp_ns ? record->timestamp_ns - prev_timestamp_ns : 0;
        prev_timestamp_ns = record->timestamp_ns;

        std::cout << (record->is_upstream() ? "US" : "DS") << " Record " << record->number
                  << " @ " << format_seconds(record->timestamp_ns) << "s (+" << delta << "ns)";
        std::cout << " (count: " << record->count << ", lfsr: 0x" << std::hex << std::setfill('0')
                  << std::setw(4) << record->lfsr << std::dec
                  << ", metadata_offset: " << record->metadata_offset << " ("
                  << (record->extra_metadata_present ? 1 : 0) << "), flags: 0x" << std::hex
                  << std::setw(8) << record->flags << std::dec << std::setfill(' ')
                  << ", data_offset: " << record->data_offset << "): ";
        printHex(*data);
        std::cout << "\n";
    }

    return 0;
}

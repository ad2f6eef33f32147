#include <exception>
#include <iostream>
#include <optional>

#include <padio/padio_io.hpp>

using namespace padio;

int main(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "Usage: " << argv[0] << " <pad_file> <pcapng_file>\n";
        return 2;
    }

    auto reader = CaptureFileReader::open(argv[1]);
    if (!reader) {
        std::cerr << "Error opening file " << argv[1] << ": "
                  << utils::error_message(reader.error()) << "\n";
        return 1;
    }

    const CaptureHeader& header = reader->header();
    std::cout << "Module type: " << header.module_type << "\n";
    std::cout << "Port ID: " << header.port_id << "\n";
    std::cout << "Records: " << header.first_record_number << " - " << header.last_record_number
              << "\n";

    // Only PCIe analyzer captures have a dissector for the resulting packets
    if (!is_supported_module_type(header.module_type)) {
        std::cerr << "Error: Unsupported module type: " << header.module_type << "\n";
        return 1;
    }

    std::optional<PcapngCaptureWriter> writer;
    try {
        writer.emplace(argv[2], header);
    } catch (const std::exception& e) {
        std::cerr << "Error opening file " << argv[2] << ": " << e.what() << "\n";
        return 1;
    }

    bool write_failed = false;
    bool bad_count = false;
    auto result = reader->for_each_record([&](const Record& record, auto payload) {
        if (record.count != 1) {
            std::cerr << "Error: record " << record.number << " has count " << record.count
                      << ", expected 1\n";
            bad_count = true;
            return false;
        }
        if (!writer->write_record(header, record, payload)) {
            std::cerr << "Error writing record " << record.number << " to " << argv[2] << "\n";
            write_failed = true;
            return false;
        }
        return true;
    });

    if (!result) {
        std::cerr << "Error reading " << argv[1] << ": " << utils::error_message(result.error())
                  << "\n";
        return 1;
    }
    if (bad_count || write_failed) {
        return 1;
    }
    if (!writer->flush()) {
        std::cerr << "Error flushing " << argv[2] << "\n";
        return 1;
    }

    std::cout << "Wrote " << writer->records_written() << " records to " << argv[2] << "\n";
    return 0;
}

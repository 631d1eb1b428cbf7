#include <iostream>
#include <string>

#include "config/exit_codes.h"
#include "storage/archive/archive_reader.h"

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        std::cerr << "Usage: chatarc_verify <archive.zst>\n";
        return chatarc::config::kExitError;
    }
    const std::string path = argv[1];

    chatarc::storage::VerifyReport report;
    auto st = chatarc::storage::ArchiveReader::Verify(path, &report);
    if (!st.ok())
    {
        std::cerr << "Verification failed: " << st.ToString() << "\n";
        return chatarc::config::VerifyExitCode(st, report);
    }

    std::cout << "Last committed message: " << report.counters.last_committed_message_id << "\n";
    std::cout << "Messages committed: " << report.counters.total_messages_committed << "\n";
    std::cout << "Uncompressed bytes committed: " << report.counters.total_uncompressed_bytes_committed << "\n";
    std::cout << "Batch region bytes: " << report.batch_region_bytes << "\n";
    std::cout << "Decoded bytes: " << report.decoded_bytes << "\n";
    std::cout << "Transcript lines: " << report.transcript_lines << "\n";
    std::cout << "Reconciled: " << (report.reconciled ? "yes" : "no") << "\n";
    return chatarc::config::VerifyExitCode(st, report);
}

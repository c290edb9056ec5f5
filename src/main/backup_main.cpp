#include "main/backup_main.hpp"
#include "backup/backup_cli.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <string>

void printBackupUsage() {
    std::cout << "Usage: discvault <command> [options]\n"
              << "Commands:\n"
              << "  start     - Extract, checksum, protect and verify a medium\n"
              << "  resume    - Continue an interrupted job\n"
              << "  verify    - Re-verify a finished job without touching the source\n"
              << "  report    - Print the verification report of a finished job\n"
              << "  list      - List the jobs under a destination\n"
              << "\n"
              << "  discvault start -i <source> -o <destination> [options]\n"
              << "  discvault resume <jobId> -o <destination>\n"
              << "  discvault verify <jobId> -o <destination>\n"
              << "  discvault report <jobId> -o <destination>\n"
              << "  discvault list -o <destination>\n"
              << "\n"
              << "Start options:\n"
              << "  -i, --input          Source device or image file\n"
              << "  -o, --output         Destination (staging root)\n"
              << "  --kind               optical-audio, optical-data or cartridge\n"
              << "  --label              Volume label (probed when omitted)\n"
              << "  --name               Job name\n"
              << "  --ratio              Redundancy ratio in (0, 1) (default 0.25)\n"
              << "  --algorithm          sha256, sha512, sha1, md5 or blake2b512\n"
              << "  --codec              Redundancy codec (default xor)\n"
              << "  --extractor          image or process\n"
              << "  --command            External reader command, e.g. \"ddrescue {device} image.iso\"\n"
              << "  --recovery-pass      Command run after --command succeeds, e.g. a second ddrescue pass\n"
              << "  --no-eject           Leave the medium in the drive when the job ends\n"
              << "  --unit-size          Unit size in bytes (default 1048576)\n"
              << "  --retries            Maximum extraction attempts (default 3)\n"
              << "  --retry-delay        Base retry delay in seconds (default 2)\n"
              << "  --stall-timeout      Seconds without progress before extraction fails (default 300)\n"
              << "  --threads            Worker threads (default 4)\n"
              << "  --wait               Seconds to wait for the source to become readable\n"
              << "  --config             JSON config file, overridden by other flags\n"
              << "\n"
              << "Exit status: 0 verified, 1 degraded, 2 failed, 3 invalid invocation\n";
}

int backupMain(int argc, char* argv[]) {
    try {
        BackupCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        Logger::error("Error in backup main: " + std::string(e.what()));
        return kExitFailed;
    }
}

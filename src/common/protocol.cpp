#include "common/protocol.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <vector>

namespace neolan::ipmsg {

std::string_view command_name(uint32_t command) {
    switch (get_mode(command)) {
        case NOOPERATION:     return "NOOPERATION";
        case BR_ENTRY:        return "BR_ENTRY";
        case BR_EXIT:         return "BR_EXIT";
        case ANSENTRY:        return "ANSENTRY";
        case BR_ABSENCE:      return "BR_ABSENCE";
        case BR_ISGETLIST:    return "BR_ISGETLIST";
        case OKGETLIST:       return "OKGETLIST";
        case GETLIST:         return "GETLIST";
        case ANSLIST:         return "ANSLIST";
        case BR_ISGETLIST2:   return "BR_ISGETLIST2";
        case SENDMSG:         return "SENDMSG";
        case RECVMSG:         return "RECVMSG";
        case READMSG:         return "READMSG";
        case DELMSG:          return "DELMSG";
        case ANSREADMSG:      return "ANSREADMSG";
        case GETINFO:         return "GETINFO";
        case SENDINFO:        return "SENDINFO";
        case GETABSENCEINFO:  return "GETABSENCEINFO";
        case SENDABSENCEINFO: return "SENDABSENCEINFO";
        case GETFILEDATA:     return "GETFILEDATA";
        case RELEASEFILES:    return "RELEASEFILES";
        case GETDIRFILES:     return "GETDIRFILES";
        case GETPUBKEY:       return "GETPUBKEY";
        case ANSPUBKEY:       return "ANSPUBKEY";
        default:              return "UNKNOWN";
    }
}

std::string describe_command(uint32_t command) {
    std::vector<std::string_view> flags;
    if (has_opt(command, FILEATTACHOPT)) flags.push_back("FILEATTACH");
    if (has_opt(command, UTF8OPT))       flags.push_back("UTF8");
    if (has_opt(command, ENCRYPTOPT))    flags.push_back("ENCRYPT");

    // 0x100 / 0x200 的含义取决于 mode
    auto mode = get_mode(command);
    if (mode == SENDMSG) {
        if (has_opt(command, SENDCHECKOPT)) flags.push_back("SENDCHECK");
        if (has_opt(command, SECRETOPT))    flags.push_back("SECRET");
        if (has_opt(command, BROADCASTOPT)) flags.push_back("BROADCAST");
        if (has_opt(command, AUTORETOPT))   flags.push_back("AUTORET");
    } else {
        if (has_opt(command, ABSENCEOPT))   flags.push_back("ABSENCE");
        if (has_opt(command, SERVEROPT))    flags.push_back("SERVER");
    }

    if (flags.empty()) {
        return fmt::format("{} (0x{:08X})", command_name(command), command);
    }
    return fmt::format("{} (0x{:08X}) [{}]", command_name(command), command, fmt::join(flags, "|"));
}

}  // namespace neolan::ipmsg

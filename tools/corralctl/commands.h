#pragma once

#include <corral/browser-service.h>
#include <corral/config.h>
#include <corral/result.hpp>

#include <functional>
#include <string>
#include <vector>

namespace corral::ctl {

// Iterator type for passing remaining args to sub-parsers
using ArgIt = std::vector<std::string>::const_iterator;

// Common context passed down to every command
struct CmdContext {
    std::string prog;
    Config::Ptr config;
    // Attach to a worker that is already listening instead of spawning one
    bool attach = false;
};

using CmdFn = std::function<Result<void>(const CmdContext& ctx, ArgIt begin, ArgIt end)>;

Result<void> cmdNavigate(const CmdContext& ctx, ArgIt begin, ArgIt end);
Result<void> cmdState(const CmdContext& ctx, ArgIt begin, ArgIt end);
Result<void> cmdBack(const CmdContext& ctx, ArgIt begin, ArgIt end);
Result<void> cmdForward(const CmdContext& ctx, ArgIt begin, ArgIt end);
Result<void> cmdRefresh(const CmdContext& ctx, ArgIt begin, ArgIt end);
Result<void> cmdClick(const CmdContext& ctx, ArgIt begin, ArgIt end);
Result<void> cmdType(const CmdContext& ctx, ArgIt begin, ArgIt end);
Result<void> cmdSelect(const CmdContext& ctx, ArgIt begin, ArgIt end);
Result<void> cmdExtract(const CmdContext& ctx, ArgIt begin, ArgIt end);
Result<void> cmdScreenshot(const CmdContext& ctx, ArgIt begin, ArgIt end);
Result<void> cmdCaptcha(const CmdContext& ctx, ArgIt begin, ArgIt end);
Result<void> cmdDo(const CmdContext& ctx, ArgIt begin, ArgIt end);

} // namespace corral::ctl

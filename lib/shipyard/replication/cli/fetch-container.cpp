/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cerrno>
#include <cstdlib>
#include <shipyard/common/cli.hpp>
#include <shipyard/common/logger.hpp>
#include <shipyard/replication/client.hpp>

namespace {
    using namespace shipyard;
    using namespace shipyard::replication;

    uint64_t container_id_from_str(const std::string &str)
    {
        char *end;
        errno = 0;
        const auto val = strtoull(str.c_str(), &end, 10);
        if (errno || end == str.c_str() || *end != '\0' || str.starts_with('-')) [[unlikely]]
            throw error(fmt::format("a container id must be an unsigned integer but got '{}'", str));
        return val;
    }
}

namespace shipyard::cli::fetch_container {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "fetch-container";
            cmd.desc = "Download a container from the peer configured in a JSON transport configuration";
            cmd.args.expect({ "<config.json>", "<container-id>" });
            cmd.opts.try_emplace("output", "write the container to this path instead of the configured working directory");
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto cfg = load_transport_config(args.at(0));
            const auto container_id = container_id_from_str(args.at(1));
            logger::info("fetching container {} from {}", container_id, cfg.peer);
            client_t client { cfg };
            const auto &out_path = opts.at("output");
            const auto path = out_path ? client.download(container_id, *out_path) : client.download(container_id);
            logger::info("container {} saved to {}", container_id, path.string());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}

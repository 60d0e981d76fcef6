/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <shipyard/common/cli.hpp>
#include <shipyard/replication/tls.hpp>

namespace shipyard::cli::make_cert {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "make-cert";
            cmd.desc = "Generate an Ed25519 key and a self-signed certificate for development peers";
            cmd.args.expect({ "<cert-path>", "<key-path>" });
            cmd.opts.try_emplace("name", "the subject and DNS alt name of the certificate", std::string { replication::test_authority });
        }

        void run(const arguments &args, const options &opts) const override
        {
            replication::tls::write_self_signed_cert(args.at(0), args.at(1), opts.at("name").value());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}

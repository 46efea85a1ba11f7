/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/ledger/host.hpp>

namespace treasure_core::ledger {
    static address _address_from_json(const json::object &j, const std::string_view name)
    {
        const auto it = j.find(name);
        if (it == j.end())
            throw error("program configuration misses the {} element", name);
        return address::from_hex(static_cast<std::string_view>(it->value().as_string()));
    }

    program_config program_config::from_json(const json::object &j)
    {
        program_config cfg {};
        cfg.program_id = _address_from_json(j, "programId");
        cfg.token_program_id = _address_from_json(j, "tokenProgramId");
        cfg.collectible_program_id = _address_from_json(j, "collectibleProgramId");
        if (const auto it = j.find("minDepositTokens"); it != j.end())
            cfg.min_deposit_tokens = json::value_to<uint64_t>(it->value());
        if (cfg.program_id == cfg.token_program_id || cfg.program_id == cfg.collectible_program_id)
            throw error("the program id must differ from the ids of the external services");
        return cfg;
    }

    const program_config &program_config::get()
    {
        static const program_config cfg = from_json(configs_dir::get().at("program").json());
        return cfg;
    }
}

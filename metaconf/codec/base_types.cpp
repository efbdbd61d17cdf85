#include "metaconf/codec/registry.h"

namespace metaconf {
const char* base_type_definitions() {
    return R"json({
    "Balance": "u128",
    "BalanceOf": "Balance",
    "BlockNumber": "u32",
    "BlockNumberFor": "BlockNumber",
    "Index": "u32",
    "Nonce": "Index",
    "RefCount": "u32",
    "Moment": "u64",
    "MomentOf": "Moment",
    "Weight": "u64",
    "Perbill": "u32",
    "Permill": "u32",
    "Percent": "u8",
    "Perquintill": "u64",
    "FixedU128": "u128",
    "Multiplier": "FixedU128",
    "H160": "[u8; 20]",
    "H256": "[u8; 32]",
    "H512": "[u8; 64]",
    "Hash": "H256",
    "AccountId32": "[u8; 32]",
    "AccountId": "AccountId32",
    "AccountIdOf": "AccountId",
    "AccountIndex": "u32",
    "Address": "AccountId",
    "LookupSource": "Address",
    "ValidatorId": "AccountId",
    "EraIndex": "u32",
    "SessionIndex": "u32",
    "ProposalIndex": "u32",
    "ReferendumIndex": "u32",
    "PropIndex": "u32",
    "MemberCount": "u32",
    "EventIndex": "u32",
    "StorageVersion": "u16",
    "Phase": {
        "_enum": {
            "ApplyExtrinsic": "u32",
            "Finalization": "Null",
            "Initialization": "Null"
        }
    },
    "AccountData": {
        "free": "Balance",
        "reserved": "Balance",
        "miscFrozen": "Balance",
        "feeFrozen": "Balance"
    },
    "AccountInfo": {
        "nonce": "Index",
        "consumers": "RefCount",
        "providers": "RefCount",
        "sufficients": "RefCount",
        "data": "AccountData"
    },
    "LastRuntimeUpgradeInfo": {
        "specVersion": "Compact<u32>",
        "specName": "Text"
    },
    "ActiveEraInfo": {
        "index": "EraIndex",
        "start": "Option<Moment>"
    },
    "ValidatorPrefs": {
        "commission": "Compact<Perbill>",
        "blocked": "bool"
    },
    "RewardDestination": {
        "_enum": {
            "Staked": "Null",
            "Stash": "Null",
            "Controller": "Null",
            "Account": "AccountId",
            "None": "Null"
        }
    },
    "Forcing": {
        "_enum": ["NotForcing", "ForceNew", "ForceNone", "ForceAlways"]
    },
    "Releases": {
        "_enum": ["V1", "V2", "V3", "V4", "V5", "V6", "V7", "V8", "V9", "V10"]
    }
})json";
}
}  // namespace metaconf

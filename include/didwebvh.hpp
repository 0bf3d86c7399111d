#pragma once

// did:webvh verifiable history
// Composes the crypto, integrity, log and resolver modules

#include "didwebvh/common/error.hpp"
#include "didwebvh/common/time.hpp"
#include "didwebvh/crypto/key.hpp"
#include "didwebvh/crypto/multibase.hpp"
#include "didwebvh/crypto/secret.hpp"
#include "didwebvh/identity/did_key.hpp"
#include "didwebvh/integrity/data_integrity.hpp"
#include "didwebvh/integrity/jcs.hpp"
#include "didwebvh/resolver/resolver.hpp"
#include "didwebvh/storage/file_store.hpp"
#include "didwebvh/webvh/field_action.hpp"
#include "didwebvh/webvh/log_entry.hpp"
#include "didwebvh/webvh/log_entry_state.hpp"
#include "didwebvh/webvh/parameters.hpp"
#include "didwebvh/webvh/state.hpp"
#include "didwebvh/webvh/url.hpp"
#include "didwebvh/webvh/witness.hpp"
#include "didwebvh/webvh/witness_proofs.hpp"

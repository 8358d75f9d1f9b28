#pragma once

// High-level didkey facade
// Composes identity, suite, context and credential modules

#include "didkey/common/config.hpp"
#include "didkey/common/encoding.hpp"
#include "didkey/common/error.hpp"
#include "didkey/common/json.hpp"
#include "didkey/credential/verifiable_credential.hpp"
#include "didkey/credential/verifiable_presentation.hpp"
#include "didkey/didkey.hpp"
#include "didkey/identity/did_key.hpp"
#include "didkey/identity/key.hpp"
#include "didkey/identity/key_material.hpp"

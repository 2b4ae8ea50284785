#pragma once

#include "gemstream/protocol/gemini/enums/side.hpp"
#include "gemstream/protocol/gemini/enums/message_kind.hpp"
#include "gemstream/protocol/gemini/enums/payload_type.hpp"

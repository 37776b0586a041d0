#pragma once

#include "protocol/buffer_reader.hpp"
#include "protocol/buffer_writer.hpp"
#include "protocol/serializable.hpp"
#include "protocol/message_type.hpp"
#include "protocol/packet.hpp"
#include "protocol/snapshot.hpp"
#include "protocol/fire_request.hpp"
#include "protocol/pilot_pose.hpp"

#pragma once

#include "mq/archive.hpp"
#include "mq/channel-owner.hpp"
#include "mq/correlation-table.hpp"
#include "mq/endpoint-config.hpp"
#include "mq/envelope-codec.hpp"
#include "mq/loopback-broker.hpp"
#include "mq/message.hpp"
#include "mq/properties.hpp"
#include "mq/proxy.hpp"
#include "mq/rpc-client.hpp"
#include "mq/rpc-error.hpp"
#include "mq/rpc-server.hpp"
#include "mq/serializer.hpp"
#include "mq/server-failure.hpp"
#include "mq/transport.hpp"

#pragma once

#include <pushgw/version.hpp>
#include <pushgw/errors.hpp>
#include <pushgw/logger.h>
#include <pushgw/encoding.hpp>
#include <pushgw/path_builder.hpp>
#include <pushgw/gateway_url.hpp>
#include <pushgw/label_validator.hpp>
#include <pushgw/serializer.hpp>
#include <pushgw/response_classifier.hpp>
#include <pushgw/http/transport.hpp>
#include <pushgw/http/beast_transport.hpp>
#include <pushgw/push_client.hpp>

#pragma once

#include <tlsfp/ja3/error_code.hpp>
#include <tlsfp/ja3/exception.hpp>
#include <tlsfp/ja3/client_fingerprint.hpp>
#include <tlsfp/ja3/server_fingerprint.hpp>
#include <tlsfp/ja3/fingerprint_printer.hpp>

//
// General utilities: base64, uuids, exception dumps and port checks
//

#ifndef BIGDATA_GATEWAY_GENERALUTILS_H
#define BIGDATA_GATEWAY_GENERALUTILS_H

#include <cstdint>
#include <exception>
#include <string>

auto base64Encode(const std::string &input) -> std::string;
// Throws std::invalid_argument if input contains anything outside the base64 alphabet
auto base64Decode(const std::string &input) -> std::string;
auto generateUUID() -> std::string;
void dumpExceptions(const std::exception& exception);
void handleSegv();
// Polls a local port until something accepts a connection on it
auto acceptingConnections(uint16_t port, uint32_t attempts = 10) -> bool;

#ifdef BUILD_TESTS
// NOLINTBEGIN
#define EXPOSE_PROPERTY_FOR_TESTING(term) public: auto get##term () { return &term; } auto set##term (typeof(term) value) { term = value; }
#define EXPOSE_PROPERTY_FOR_TESTING_READONLY(term) public: auto get##term () { return &term; }
#define EXPOSE_FUNCTION_FOR_TESTING(term) public: auto call##term () { return term(); }
#define EXPOSE_FUNCTION_FOR_TESTING_ONE_PARAM(term, param) public: auto call##term (param value) { return term(value); }
// NOLINTEND
#else
// Noop
#define EXPOSE_PROPERTY_FOR_TESTING(x)
#define EXPOSE_PROPERTY_FOR_TESTING_READONLY(x)
#define EXPOSE_FUNCTION_FOR_TESTING(x)
#define EXPOSE_FUNCTION_FOR_TESTING_ONE_PARAM(x, y)
#endif

#endif //BIGDATA_GATEWAY_GENERALUTILS_H

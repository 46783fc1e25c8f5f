#pragma once

namespace chunkswarm::core {

// Builds one visitor for std::visit out of several lambdas.
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

}

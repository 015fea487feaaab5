#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>

namespace titan::hub {

/// Strand serializing the hub's scheduling flow (dispatch, transitions, sweeps,
/// notifications). Handlers run on the underlying executor instead.
using HubStrand = boost::asio::strand<boost::asio::any_io_executor>;

} // namespace titan::hub

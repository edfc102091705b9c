#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace finforecast::core {

/// Base class for failures of forecasting operations that callers may want to tell apart.
class ForecastError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/// Fewer historical months than a model needs. Recoverable once more data is collected.
class InsufficientHistoryError : public ForecastError {
public:
	InsufficientHistoryError(std::size_t available, std::size_t required)
	    : ForecastError("Insufficient historical data for forecasting (minimum " + std::to_string(required) +
	                    " periods required, " + std::to_string(available) + " available)"),
	      available_(available), required_(required) {
	}

	std::size_t available() const {
		return available_;
	}
	std::size_t required() const {
		return required_;
	}

private:
	std::size_t available_;
	std::size_t required_;
};

/// Unknown forecast id, or a forecast owned by another user.
class NotFoundError : public ForecastError {
public:
	using ForecastError::ForecastError;
};

/// A transaction, budget or actual-spend collaborator failed or returned unusable data.
class UpstreamDataError : public ForecastError {
public:
	using ForecastError::ForecastError;
};

/// An algorithm name outside the supported set.
class UnsupportedAlgorithmError : public ForecastError {
public:
	explicit UnsupportedAlgorithmError(const std::string &name)
	    : ForecastError("Unsupported forecasting algorithm: '" + name + "'"), name_(name) {
	}

	const std::string &name() const {
		return name_;
	}

private:
	std::string name_;
};

/// A request field outside its accepted range or vocabulary.
class InvalidRequestError : public ForecastError {
public:
	using ForecastError::ForecastError;
};

} // namespace finforecast::core

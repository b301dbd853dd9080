#include <cascade/exceptions.h>
#include <cascade/status.h>
#include <boost/json.hpp>
#include <boost/system/system_error.hpp>
#include <cctype>
#include <cerrno>
#include <system_error>

namespace cascade {

namespace {

    // "I'm a Teapot" -> "ImATeapotError"
    std::string error_name(int status) {
        const std::string_view phrase = status::message(status);
        if (phrase.empty()) {
            return "HttpError";
        }

        std::string name;
        bool word_start = true;
        for (char c : phrase) {
            const auto uc = static_cast<unsigned char>(c);
            if (c == ' ' || c == '-') {
                word_start = true;
            } else if (std::isalnum(uc)) {
                name += word_start ? static_cast<char>(std::toupper(uc)) : c;
                word_start = false;
            }
        }
        if (!name.ends_with("Error")) {
            name += "Error";
        }
        return name;
    }

    std::string errno_name(int value) {
        switch (value) {
            case ENOENT: return "ENOENT";
            case EACCES: return "EACCES";
            case EPIPE: return "EPIPE";
            case ECONNRESET: return "ECONNRESET";
            case ECONNABORTED: return "ECONNABORTED";
            case ECONNREFUSED: return "ECONNREFUSED";
            case ETIMEDOUT: return "ETIMEDOUT";
            case ENOTCONN: return "ENOTCONN";
            default: return {};
        }
    }

    bool is_errno_category(const std::error_category& category) {
        return category == std::generic_category() || category == std::system_category();
    }

    bool is_errno_category(const boost::system::error_category& category) {
        return category == boost::system::generic_category() || category == boost::system::system_category();
    }

    Error non_error(const boost::json::value& value) {
        return Error("non-error thrown: " + boost::json::serialize(value));
    }

} // namespace

Error::Error(const std::string& message, std::string name)
    : std::runtime_error(message), name_(std::move(name)) {
}

std::string Error::to_string() const {
    std::string msg = what();
    if (msg.empty()) {
        return name_;
    }
    return name_ + ": " + msg;
}

HttpError::HttpError(int status, const std::string& msg)
    : Error(msg.empty() ? std::string(status::message(status)) : msg, error_name(status)) {
    set_status(status);
    set_expose(status < 500);
}

HttpError::HttpError(int status, const std::string& msg, HeaderList headers)
    : HttpError(status, msg) {
    set_headers(std::move(headers));
}

Error normalize_error(std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const Error& e) {
        return e;
    } catch (const boost::system::system_error& e) {
        Error err(e.what());
        if (is_errno_category(e.code().category())) {
            err.set_code(errno_name(e.code().value()));
        }
        return err;
    } catch (const std::system_error& e) {
        Error err(e.what());
        if (is_errno_category(e.code().category())) {
            err.set_code(errno_name(e.code().value()));
        }
        return err;
    } catch (const std::exception& e) {
        return Error(e.what());
    } catch (const std::string& value) {
        return non_error(boost::json::value(value));
    } catch (const char* value) {
        return non_error(value ? boost::json::value(value) : boost::json::value(nullptr));
    } catch (const boost::json::value& value) {
        return non_error(value);
    } catch (bool value) {
        return non_error(boost::json::value(value));
    } catch (int value) {
        return non_error(boost::json::value(value));
    } catch (long value) {
        return non_error(boost::json::value(value));
    } catch (long long value) {
        return non_error(boost::json::value(value));
    } catch (unsigned value) {
        return non_error(boost::json::value(value));
    } catch (double value) {
        return non_error(boost::json::value(value));
    } catch (...) {
        // Unknown payload type; there is nothing to serialize.
        return Error("non-error thrown: undefined");
    }
}

} // namespace cascade

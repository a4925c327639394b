#include "flowhttp/error.hpp"

#include <boost/system/errc.hpp>

#include <format>
#include <utility>

namespace flowhttp
{

// =================================================================================================

namespace
{
class Category : public boost::system::error_category
{
public:
   const char* name() const noexcept override { return "flowhttp"; }

   std::string message(int ev) const override
   {
      switch (static_cast<error>(ev))
      {
      case error::malformed_target:
         return "malformed target";
      case error::unsupported_content:
         return "unsupported content";
      case error::double_send:
         return "request already sent";
      case error::empty_body:
         return "empty body";
      case error::transport:
         return "transport error";
      case error::invalid_media_type:
         return "invalid media type";
      case error::body_already_set:
         return "body already set";
      case error::headers_read_only:
         return "headers are read-only";
      case error::decoding_failed:
         return "decoding failed";
      default:
         return std::format("unknown flowhttp error ({})", ev);
      }
   }
};
} // namespace

const boost::system::error_category& category() noexcept
{
   static const Category instance;
   return instance;
}

boost::system::error_code make_error_code(error e) noexcept
{
   return {static_cast<int>(e), category()};
}

void throw_error(error e, const std::string& what)
{
   throw boost::system::system_error(make_error_code(e), what);
}

bool is_flowhttp_error(const boost::system::error_code& ec) noexcept
{
   return ec.category() == category();
}

// -------------------------------------------------------------------------------------------------

namespace
{
boost::system::error_code code_of(const std::exception_ptr& ptr)
{
   try
   {
      std::rethrow_exception(ptr);
   }
   catch (const boost::system::system_error& ex)
   {
      return ex.code();
   }
   catch (const std::exception&)
   {
      return boost::system::errc::make_error_code(boost::system::errc::io_error);
   }
}

std::string message_of(const std::exception_ptr& ptr)
{
   try
   {
      std::rethrow_exception(ptr);
   }
   catch (const std::exception& ex)
   {
      return ex.what();
   }
}
} // namespace

TransportError::TransportError(boost::system::error_code cause, const std::string& what)
   : boost::system::system_error(make_error_code(error::transport),
                                 std::format("{}: {}", what, cause.message())),
     m_cause(cause)
{
}

TransportError::TransportError(std::exception_ptr nested)
   : boost::system::system_error(make_error_code(error::transport), message_of(nested)),
     m_cause(code_of(nested)), m_nested(std::move(nested))
{
}

void rethrow_as_transport_error(std::exception_ptr ptr)
{
   try
   {
      std::rethrow_exception(ptr);
   }
   catch (const TransportError&)
   {
      throw;
   }
   catch (const boost::system::system_error& ex)
   {
      if (is_flowhttp_error(ex.code()))
         throw;
      throw TransportError(ptr);
   }
   catch (const std::exception&)
   {
      throw TransportError(ptr);
   }
}

// =================================================================================================

} // namespace flowhttp

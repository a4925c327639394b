#include "flowhttp/common.hpp"

#include <boost/beast/http/verb.hpp>
#include <boost/system/system_error.hpp>

#include <format>

// =================================================================================================

std::string what(const boost::system::error_code& ec) { return ec.message(); }

std::string what(const std::exception_ptr& ptr)
{
   if (!ptr)
      return "success";
   else
   {
      try
      {
         std::rethrow_exception(ptr);
      }
      catch (boost::system::system_error& ex)
      {
         return std::format("exception: {}", ex.what());
      }
      catch (std::exception& ex)
      {
         return std::format("exception: {}", ex.what());
      }
   }
}

// =================================================================================================

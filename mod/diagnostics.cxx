// file      : mod/diagnostics.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mod/diagnostics.hxx>

using namespace std;

namespace stackhook
{
  diag_record::
  diag_record (diag_record&& r)
      : uncaught_ (r.uncaught_),
        data_ (move (r.data_)),
        epilogue_ (r.epilogue_)
  {
    os_ << r.os_.str ();

    r.data_.clear (); // Empty.
  }

  diag_record::
  ~diag_record () noexcept(false)
  {
    // Don't flush the record if this destructor was called as part of the
    // stack unwinding.
    //
    if (!data_.empty () && uncaught_ == uncaught_exceptions ())
    {
      data_.back ().msg = os_.str (); // Save last message.

      assert (epilogue_ != nullptr);
      (*epilogue_) (move (data_)); // Can throw.
    }
  }
}

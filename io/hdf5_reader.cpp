// Reads numeric variables out of HDF5 files, such as MATLAB v7.3 MAT-files.
// Author: Philip Salvaggio

#include "hdf5_reader.h"

#include "io/logging.h"

#include <hdf5.h>
#include <hdf5_hl.h>

#include <vector>

using namespace std;

namespace zab_io {

bool HDF5Reader::Read(const string& filename,
                      const string& dataset,
                      cv::Mat_<double>* data) {
  if (!data) return false;

  hid_t loc_id = H5Fopen(filename.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
  if (loc_id < 0) {
    mainLog() << "Error: Could not open HDF5 file " << filename << endl;
    return false;
  }

  string path = dataset;
  if (path.empty() || path[0] != '/') path = "/" + path;

  htri_t valid = H5LTpath_valid(loc_id, path.c_str(), true);
  if (valid <= 0) {
    mainLog() << "Error: Invalid dataset " << dataset << " in HDF5 file "
              << filename << endl;
    H5Fclose(loc_id);
    return false;
  }

  int rank = 0;
  if (H5LTget_dataset_ndims(loc_id, path.c_str(), &rank) < 0 ||
      rank < 1 || rank > 2) {
    mainLog() << "Error: Dataset " << dataset << " must be 1D or 2D." << endl;
    H5Fclose(loc_id);
    return false;
  }

  H5T_class_t class_id;
  hsize_t dims[2] = {1, 1};
  size_t dtype_size;
  if (H5LTget_dataset_info(loc_id, path.c_str(),
        dims, &class_id, &dtype_size) < 0) {
    mainLog() << "Error: Could not query dataset size." << endl;
    H5Fclose(loc_id);
    return false;
  }

  if (class_id != H5T_FLOAT && class_id != H5T_INTEGER) {
    mainLog() << "Error: Dataset " << dataset << " is not numeric." << endl;
    H5Fclose(loc_id);
    return false;
  }

  // Row-major dimensions as stored in the file.
  const int kRows = static_cast<int>(dims[0]);
  const int kCols = (rank == 2) ? static_cast<int>(dims[1]) : 1;
  if (kRows == 0 || kCols == 0) {
    mainLog() << "Error: Dataset " << dataset << " is empty." << endl;
    H5Fclose(loc_id);
    return false;
  }

  vector<double> buffer(static_cast<size_t>(kRows) * kCols);
  if (H5LTread_dataset_double(loc_id, path.c_str(), buffer.data()) < 0) {
    mainLog() << "Error: Could not read the dataset." << endl;
    H5Fclose(loc_id);
    return false;
  }
  H5Fclose(loc_id);

  cv::Mat_<double> stored(kRows, kCols);
  for (int i = 0; i < kRows; i++) {
    for (int j = 0; j < kCols; j++) {
      stored(i, j) = buffer[static_cast<size_t>(i) * kCols + j];
    }
  }

  if (rank == 1) {
    *data = stored;
  } else {
    cv::transpose(stored, *data);
  }
  return true;
}

}

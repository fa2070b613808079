// Evaluation of Zernike polynomials in Noll's ordering.
// Author: Philip Salvaggio

#ifndef ZERNIKE_ABERRATIONS_H
#define ZERNIKE_ABERRATIONS_H

namespace zab {

// Convert a Noll index to the radial order and azimuthal frequency of the
// Zernike polynomial. Orders are enumerated by ascending n, then ascending
// |m|. For m != 0, even indices are the cosine terms (m > 0) and odd indices
// the sine terms (m < 0).
//
//  1 - Piston        (0,  0)
//  2 - Tilt X        (1,  1)
//  3 - Tilt Y        (1, -1)
//  4 - Defocus       (2,  0)
//  5 - Astigmatism   (2, -2)
//  6 - Astigmatism   (2,  2)
//  7 - Coma Y        (3, -1)
//  8 - Coma X        (3,  1)
//  ...
// 11 - Spherical     (4,  0)
//
// Arguments:
//  j  Noll index (1-based)
//  n  Output: radial order
//  m  Output: signed azimuthal frequency
void NollToZernikeIndices(int j, int* n, int* m);

// Radial polynomial R_n^m(rho), for m >= 0 and n - m even.
double ZernikeRadial(int n, int m, double rho);

// Orthonormal Zernike polynomial on the unit disk, so that the RMS over the
// disk is 1 (piston excepted, which is 1 everywhere).
//
// Arguments:
//  n      Radial order
//  m      Signed azimuthal frequency. Negative values give the sine terms.
//  rho    Normalized radius
//  theta  Angle CCW from the +x axis [rad]
double ZernikePolynomial(int n, int m, double rho, double theta);

}

#endif  // ZERNIKE_ABERRATIONS_H

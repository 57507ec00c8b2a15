///////////////////////////////////////////////////////////////////////////////
///
///	\file    DataArray3D.h
///	\author  Paul Ullrich
///	\version October 19, 2026
///
///	<remarks>
///		Copyright 2000-2026 Paul Ullrich
///
///		This file is distributed as part of the ClimDiag source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _DATAARRAY3D_H_
#define _DATAARRAY3D_H_

///////////////////////////////////////////////////////////////////////////////

#include "Exception.h"

#include <cstdlib>

///	<summary>
///		A three-dimensional row-major array owning a contiguous buffer.
///		Diagnostic fields are stored (time, lat, lon).
///	</summary>
template <typename T>
class DataArray3D {

public:
	typedef T ValueType;

	///	<summary>
	///		Constructor.
	///	</summary>
	DataArray3D() :
		m_data1D(NULL)
	{
		m_sSize[0] = 0;
		m_sSize[1] = 0;
		m_sSize[2] = 0;
	}

	///	<summary>
	///		Constructor allowing specification of size.
	///	</summary>
	DataArray3D(
		size_t sSize0,
		size_t sSize1,
		size_t sSize2
	) :
		m_data1D(NULL)
	{
		m_sSize[0] = 0;
		m_sSize[1] = 0;
		m_sSize[2] = 0;

		Allocate(sSize0, sSize1, sSize2);
	}

	///	<summary>
	///		Copy constructor.
	///	</summary>
	DataArray3D(const DataArray3D<T> & da) :
		m_data1D(NULL)
	{
		m_sSize[0] = 0;
		m_sSize[1] = 0;
		m_sSize[2] = 0;

		Assign(da);
	}

	///	<summary>
	///		Move constructor.
	///	</summary>
	DataArray3D(DataArray3D<T> && da) :
		m_data1D(da.m_data1D)
	{
		for (int d = 0; d < 3; d++) {
			m_sSize[d] = da.m_sSize[d];
			da.m_sSize[d] = 0;
		}
		da.m_data1D = NULL;
	}

	///	<summary>
	///		Destructor.
	///	</summary>
	virtual ~DataArray3D() {
		Deallocate();
	}

	///	<summary>
	///		Allocate data in this DataArray3D.  Content is zeroed.
	///	</summary>
	void Allocate(
		size_t sSize0,
		size_t sSize1,
		size_t sSize2
	) {
		if ((m_data1D == NULL) ||
		    (m_sSize[0] != sSize0) ||
		    (m_sSize[1] != sSize1) ||
		    (m_sSize[2] != sSize2)
		) {
			Deallocate();

			if ((sSize0 == 0) || (sSize1 == 0) || (sSize2 == 0)) {
				return;
			}

			m_data1D = new T[sSize0 * sSize1 * sSize2];
			m_sSize[0] = sSize0;
			m_sSize[1] = sSize1;
			m_sSize[2] = sSize2;
		}

		Zero();
	}

	///	<summary>
	///		Deallocate data from this DataArray3D.
	///	</summary>
	void Deallocate() {
		if (m_data1D != NULL) {
			delete[] m_data1D;
		}
		m_data1D = NULL;
		m_sSize[0] = 0;
		m_sSize[1] = 0;
		m_sSize[2] = 0;
	}

	///	<summary>
	///		Determine if this DataArray3D has data.
	///	</summary>
	bool IsAttached() const {
		return (m_data1D != NULL);
	}

public:
	///	<summary>
	///		Get the total number of elements.
	///	</summary>
	size_t GetTotalSize() const {
		return (m_sSize[0] * m_sSize[1] * m_sSize[2]);
	}

	///	<summary>
	///		Get the size of the specified dimension.
	///	</summary>
	inline size_t GetSize(int dim) const {
		return m_sSize[dim];
	}

public:
	///	<summary>
	///		Copy the content of another DataArray3D.
	///	</summary>
	void Assign(const DataArray3D<T> & da) {
		if (&da == this) {
			return;
		}
		if (!da.IsAttached()) {
			Deallocate();
			return;
		}

		Allocate(da.m_sSize[0], da.m_sSize[1], da.m_sSize[2]);

		size_t sTotalSize = GetTotalSize();
		for (size_t i = 0; i < sTotalSize; i++) {
			m_data1D[i] = da.m_data1D[i];
		}
	}

	///	<summary>
	///		Assignment operator.
	///	</summary>
	DataArray3D<T> & operator= (const DataArray3D<T> & da) {
		Assign(da);
		return (*this);
	}

	///	<summary>
	///		Move assignment operator.
	///	</summary>
	DataArray3D<T> & operator= (DataArray3D<T> && da) {
		if (&da != this) {
			Deallocate();
			m_data1D = da.m_data1D;
			for (int d = 0; d < 3; d++) {
				m_sSize[d] = da.m_sSize[d];
				da.m_sSize[d] = 0;
			}
			da.m_data1D = NULL;
		}
		return (*this);
	}

public:
	///	<summary>
	///		Zero the data content of this object.
	///	</summary>
	void Zero() {
		Fill(T());
	}

	///	<summary>
	///		Set every element to the given value.
	///	</summary>
	void Fill(const T & x) {
		size_t sTotalSize = GetTotalSize();
		for (size_t i = 0; i < sTotalSize; i++) {
			m_data1D[i] = x;
		}
	}

	///	<summary>
	///		Get a pointer to the data.
	///	</summary>
	T * GetData() {
		return m_data1D;
	}

	///	<summary>
	///		Get a pointer to the data.
	///	</summary>
	const T * GetData() const {
		return m_data1D;
	}

public:
	///	<summary>
	///		Parenthetical array accessor.
	///	</summary>
	inline const T & operator()(size_t i, size_t j, size_t k) const {
#if defined(DEBUG_ARRAYOUTOFBOUNDS)
		if ((i >= m_sSize[0]) || (j >= m_sSize[1]) || (k >= m_sSize[2])) {
			_EXCEPTIONT("Array access out of bounds");
		}
#endif
		return (*(m_data1D + (i * m_sSize[1] + j) * m_sSize[2] + k));
	}

	///	<summary>
	///		Parenthetical array accessor.
	///	</summary>
	inline T & operator()(size_t i, size_t j, size_t k) {
#if defined(DEBUG_ARRAYOUTOFBOUNDS)
		if ((i >= m_sSize[0]) || (j >= m_sSize[1]) || (k >= m_sSize[2])) {
			_EXCEPTIONT("Array access out of bounds");
		}
#endif
		return (*(m_data1D + (i * m_sSize[1] + j) * m_sSize[2] + k));
	}

	///	<summary>
	///		Pointer to the contiguous 2D slice at the given first index.
	///	</summary>
	inline T const * operator()(size_t i) const {
		return m_data1D + i * m_sSize[1] * m_sSize[2];
	}

	///	<summary>
	///		Pointer to the contiguous 2D slice at the given first index.
	///	</summary>
	inline T * operator()(size_t i) {
		return m_data1D + i * m_sSize[1] * m_sSize[2];
	}

private:
	///	<summary>
	///		The size of each dimension of this DataArray3D.
	///	</summary>
	size_t m_sSize[3];

	///	<summary>
	///		A pointer to the data for this DataArray3D.
	///	</summary>
	T * m_data1D;
};

///////////////////////////////////////////////////////////////////////////////

#endif

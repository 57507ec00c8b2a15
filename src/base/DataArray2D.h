///////////////////////////////////////////////////////////////////////////////
///
///	\file    DataArray2D.h
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

#ifndef _DATAARRAY2D_H_
#define _DATAARRAY2D_H_

///////////////////////////////////////////////////////////////////////////////

#include "Exception.h"

#include <cstdlib>

///	<summary>
///		A two-dimensional row-major array owning a contiguous buffer.
///	</summary>
template <typename T>
class DataArray2D {

public:
	typedef T ValueType;

	///	<summary>
	///		Constructor.
	///	</summary>
	DataArray2D() :
		m_data1D(NULL)
	{
		m_sSize[0] = 0;
		m_sSize[1] = 0;
	}

	///	<summary>
	///		Constructor allowing specification of size.
	///	</summary>
	DataArray2D(
		size_t sSize0,
		size_t sSize1
	) :
		m_data1D(NULL)
	{
		m_sSize[0] = 0;
		m_sSize[1] = 0;

		Allocate(sSize0, sSize1);
	}

	///	<summary>
	///		Copy constructor.
	///	</summary>
	DataArray2D(const DataArray2D<T> & da) :
		m_data1D(NULL)
	{
		m_sSize[0] = 0;
		m_sSize[1] = 0;

		Assign(da);
	}

	///	<summary>
	///		Move constructor.
	///	</summary>
	DataArray2D(DataArray2D<T> && da) :
		m_data1D(da.m_data1D)
	{
		m_sSize[0] = da.m_sSize[0];
		m_sSize[1] = da.m_sSize[1];

		da.m_sSize[0] = 0;
		da.m_sSize[1] = 0;
		da.m_data1D = NULL;
	}

	///	<summary>
	///		Destructor.
	///	</summary>
	virtual ~DataArray2D() {
		Deallocate();
	}

	///	<summary>
	///		Allocate data in this DataArray2D.  Content is zeroed.
	///	</summary>
	void Allocate(
		size_t sSize0,
		size_t sSize1
	) {
		if ((m_data1D == NULL) ||
		    (m_sSize[0] != sSize0) ||
		    (m_sSize[1] != sSize1)
		) {
			Deallocate();

			if ((sSize0 == 0) || (sSize1 == 0)) {
				return;
			}

			m_data1D = new T[sSize0 * sSize1];
			m_sSize[0] = sSize0;
			m_sSize[1] = sSize1;
		}

		Zero();
	}

	///	<summary>
	///		Deallocate data from this DataArray2D.
	///	</summary>
	void Deallocate() {
		if (m_data1D != NULL) {
			delete[] m_data1D;
		}
		m_data1D = NULL;
		m_sSize[0] = 0;
		m_sSize[1] = 0;
	}

	///	<summary>
	///		Determine if this DataArray2D has data.
	///	</summary>
	bool IsAttached() const {
		return (m_data1D != NULL);
	}

public:
	///	<summary>
	///		Get the size of the data.
	///	</summary>
	size_t GetTotalSize() const {
		return (m_sSize[0] * m_sSize[1]);
	}

	///	<summary>
	///		Get the number of rows in this DataArray2D.
	///	</summary>
	inline size_t GetRows() const {
		return m_sSize[0];
	}

	///	<summary>
	///		Get the number of columns in this DataArray2D.
	///	</summary>
	inline size_t GetColumns() const {
		return m_sSize[1];
	}

public:
	///	<summary>
	///		Copy the content of another DataArray2D.
	///	</summary>
	void Assign(const DataArray2D<T> & da) {
		if (&da == this) {
			return;
		}
		if (!da.IsAttached()) {
			Deallocate();
			return;
		}

		Allocate(da.m_sSize[0], da.m_sSize[1]);

		size_t sTotalSize = GetTotalSize();
		for (size_t i = 0; i < sTotalSize; i++) {
			m_data1D[i] = da.m_data1D[i];
		}
	}

	///	<summary>
	///		Assignment operator.
	///	</summary>
	DataArray2D<T> & operator= (const DataArray2D<T> & da) {
		Assign(da);
		return (*this);
	}

	///	<summary>
	///		Move assignment operator.
	///	</summary>
	DataArray2D<T> & operator= (DataArray2D<T> && da) {
		if (&da != this) {
			Deallocate();
			m_data1D = da.m_data1D;
			m_sSize[0] = da.m_sSize[0];
			m_sSize[1] = da.m_sSize[1];
			da.m_data1D = NULL;
			da.m_sSize[0] = 0;
			da.m_sSize[1] = 0;
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
	inline const T & operator()(size_t i, size_t j) const {
#if defined(DEBUG_ARRAYOUTOFBOUNDS)
		if ((i >= m_sSize[0]) || (j >= m_sSize[1])) {
			_EXCEPTIONT("Array access out of bounds");
		}
#endif
		return (*(m_data1D + i * m_sSize[1] + j));
	}

	///	<summary>
	///		Parenthetical array accessor.
	///	</summary>
	inline T & operator()(size_t i, size_t j) {
#if defined(DEBUG_ARRAYOUTOFBOUNDS)
		if ((i >= m_sSize[0]) || (j >= m_sSize[1])) {
			_EXCEPTIONT("Array access out of bounds");
		}
#endif
		return (*(m_data1D + i * m_sSize[1] + j));
	}

	///	<summary>
	///		Parenthetical array accessor (unit-stride slicer).
	///	</summary>
	inline T const * operator()(size_t i) const {
		return m_data1D + i * m_sSize[1];
	}

	///	<summary>
	///		Parenthetical array accessor (unit-stride slicer).
	///	</summary>
	inline T * operator()(size_t i) {
		return m_data1D + i * m_sSize[1];
	}

private:
	///	<summary>
	///		The size of each dimension of this DataArray2D.
	///	</summary>
	size_t m_sSize[2];

	///	<summary>
	///		A pointer to the data for this DataArray2D.
	///	</summary>
	T * m_data1D;
};

///////////////////////////////////////////////////////////////////////////////

#endif

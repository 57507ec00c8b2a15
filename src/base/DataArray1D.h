///////////////////////////////////////////////////////////////////////////////
///
///	\file    DataArray1D.h
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

#ifndef _DATAARRAY1D_H_
#define _DATAARRAY1D_H_

///////////////////////////////////////////////////////////////////////////////

#include "Exception.h"

#include <cstdlib>
#include <cstring>

///	<summary>
///		A one-dimensional array owning a contiguous buffer.
///	</summary>
template <typename T>
class DataArray1D {

public:
	typedef T ValueType;

	///	<summary>
	///		Constructor.
	///	</summary>
	DataArray1D() :
		m_sSize(0),
		m_data(NULL)
	{ }

	///	<summary>
	///		Constructor allowing specification of size.
	///	</summary>
	explicit DataArray1D(
		size_t sSize
	) :
		m_sSize(0),
		m_data(NULL)
	{
		Allocate(sSize);
	}

	///	<summary>
	///		Copy constructor.
	///	</summary>
	DataArray1D(const DataArray1D<T> & da) :
		m_sSize(0),
		m_data(NULL)
	{
		Assign(da);
	}

	///	<summary>
	///		Move constructor.
	///	</summary>
	DataArray1D(DataArray1D<T> && da) :
		m_sSize(da.m_sSize),
		m_data(da.m_data)
	{
		da.m_sSize = 0;
		da.m_data = NULL;
	}

	///	<summary>
	///		Destructor.
	///	</summary>
	virtual ~DataArray1D() {
		Deallocate();
	}

	///	<summary>
	///		Allocate data in this DataArray1D.  Content is zeroed.
	///	</summary>
	void Allocate(
		size_t sSize
	) {
		if ((m_data == NULL) || (m_sSize != sSize)) {
			Deallocate();
			if (sSize == 0) {
				return;
			}
			m_data = new T[sSize];
			m_sSize = sSize;
		}
		Zero();
	}

	///	<summary>
	///		Deallocate data from this DataArray1D.
	///	</summary>
	void Deallocate() {
		if (m_data != NULL) {
			delete[] m_data;
		}
		m_data = NULL;
		m_sSize = 0;
	}

	///	<summary>
	///		Determine if this DataArray1D has data.
	///	</summary>
	bool IsAttached() const {
		return (m_data != NULL);
	}

	///	<summary>
	///		Get the number of elements.
	///	</summary>
	inline size_t GetRows() const {
		return m_sSize;
	}

	///	<summary>
	///		Get the number of elements.
	///	</summary>
	inline size_t GetTotalSize() const {
		return m_sSize;
	}

public:
	///	<summary>
	///		Copy the content of another DataArray1D.
	///	</summary>
	void Assign(const DataArray1D<T> & da) {
		if (&da == this) {
			return;
		}
		if (!da.IsAttached()) {
			Deallocate();
			return;
		}
		Allocate(da.m_sSize);
		for (size_t i = 0; i < m_sSize; i++) {
			m_data[i] = da.m_data[i];
		}
	}

	///	<summary>
	///		Assignment operator.
	///	</summary>
	DataArray1D<T> & operator= (const DataArray1D<T> & da) {
		Assign(da);
		return (*this);
	}

	///	<summary>
	///		Move assignment operator.
	///	</summary>
	DataArray1D<T> & operator= (DataArray1D<T> && da) {
		if (&da != this) {
			Deallocate();
			m_sSize = da.m_sSize;
			m_data = da.m_data;
			da.m_sSize = 0;
			da.m_data = NULL;
		}
		return (*this);
	}

	///	<summary>
	///		Zero the data content of this object.
	///	</summary>
	void Zero() {
		for (size_t i = 0; i < m_sSize; i++) {
			m_data[i] = T();
		}
	}

	///	<summary>
	///		Set every element to the given value.
	///	</summary>
	void Fill(const T & x) {
		for (size_t i = 0; i < m_sSize; i++) {
			m_data[i] = x;
		}
	}

public:
	///	<summary>
	///		Cast to a pointer; element access through [] uses this.
	///	</summary>
	operator T*() {
		return m_data;
	}

	///	<summary>
	///		Cast to a pointer.
	///	</summary>
	operator const T*() const {
		return m_data;
	}

	///	<summary>
	///		Get a pointer to the data.
	///	</summary>
	T * GetData() {
		return m_data;
	}

	///	<summary>
	///		Get a pointer to the data.
	///	</summary>
	const T * GetData() const {
		return m_data;
	}

	///	<summary>
	///		Accessor.
	///	</summary>
	inline T & operator()(size_t i) {
#if defined(DEBUG_ARRAYOUTOFBOUNDS)
		if (i >= m_sSize) {
			_EXCEPTIONT("Array access out of bounds");
		}
#endif
		return m_data[i];
	}

	///	<summary>
	///		Accessor.
	///	</summary>
	inline const T & operator()(size_t i) const {
#if defined(DEBUG_ARRAYOUTOFBOUNDS)
		if (i >= m_sSize) {
			_EXCEPTIONT("Array access out of bounds");
		}
#endif
		return m_data[i];
	}

private:
	///	<summary>
	///		The number of elements in this DataArray1D.
	///	</summary>
	size_t m_sSize;

	///	<summary>
	///		A pointer to the data for this DataArray1D.
	///	</summary>
	T * m_data;
};

///////////////////////////////////////////////////////////////////////////////

#endif
